#include "ExtensionFilter.h"
#include "../core/Utils.h"

namespace secret_hunter {

ExtensionFilter::ExtensionFilter(std::vector<std::string> suffixes) : suffixes_(std::move(suffixes)) {
    for(auto& s : suffixes_) s = utils::to_lower(s);
}

bool ExtensionFilter::accepts(const std::filesystem::path& file) const {
    const std::string name = utils::to_lower(file.filename().string());
    if(name.empty()) return false;
    for(const auto& suffix : suffixes_) {
        if(!suffix.empty() && utils::ends_with(name, suffix)) return true;
    }
    return false;
}

}
