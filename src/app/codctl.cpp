#include <csignal>
#include <iostream>
#include <string_view>
#include <vector>

#include <Controller.hpp>

int main(int argc, char **argv) {
    // a fifo reader going away mid-write has to surface as an error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    const std::vector<std::string_view> args(argv + 1, argv + argc);
    return codctl::app::run(args, std::cout, std::cerr);
}
