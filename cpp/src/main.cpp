#include "concord/cli.hpp"

int main(int argc, char *argv[])
{
    return concord::cli::run(argc, argv);
}
