#include "cli.hpp"
#include "compact_log.hpp"
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);
    auto result = doclint::run_cli(args);
    if (!result.output.empty()) compact::Writer::print(result.output);
    if (!result.errors.empty()) compact::Writer::error(result.errors);
    return result.exit_code;
}
