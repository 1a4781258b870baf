#include "commandlines/path.hpp"

namespace commandlines {
namespace path {

std::filesystem::path make_path_from(std::string_view pathstring) {
    return std::filesystem::path(pathstring);
}

std::filesystem::path make_mut_path_from(std::string_view pathstring) {
    std::filesystem::path p(pathstring);
    return p;
}

} // namespace path
} // namespace commandlines
