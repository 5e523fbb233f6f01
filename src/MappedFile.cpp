#include "MappedFile.hpp"
#include <filesystem>

MappedFile::MappedFile(const std::string& path)
    : fileMapping(path.c_str(), boost::interprocess::read_only),
      mappedSize(0) {
    // mapped_region rejects zero-length mappings
    if (std::filesystem::file_size(path) > 0) {
        boost::interprocess::mapped_region whole(fileMapping, boost::interprocess::read_only);
        region.swap(whole);
        mappedSize = region.get_size();
    }
}

size_t MappedFile::size() const {
    return mappedSize;
}

const char* MappedFile::data() const {
    if (mappedSize == 0) return "";
    return static_cast<const char*>(region.get_address());
}
