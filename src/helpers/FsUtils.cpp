#include "FsUtils.hpp"

#include <fstream>
#include <iterator>

bool NFsUtils::isAbsolute(const std::string& sv) {
    return sv.size() > 0 && (*sv.begin() == '/' || *sv.begin() == '~');
}

std::expected<std::string, std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.good())
        return std::unexpected("No file");
    auto res = std::string((std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>()));
    if (!res.empty() && res.back() == '\n')
        res.pop_back();
    return res;
}
