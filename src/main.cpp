#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return blobkit::cli::run(argc, argv);
}
