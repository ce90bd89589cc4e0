#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace blobkit::cli {

int run(int argc, char** argv);

// arguments excludes the program name.
int run(const std::vector<std::string>& arguments, std::ostream& out, std::ostream& err);

} // namespace blobkit::cli
