#pragma once
#include <string>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only view of a whole file, unmapped when the object goes out of scope.
// Empty files are opened but not mapped; data() then points at an empty string.
// size() is the length of the mapping as made, so callers should check limits
// against it. Shrinking the file while the view is alive faults on access.
class MappedFile {
public:
    explicit MappedFile(const std::string& path);

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    size_t size() const;
    const char* data() const;

private:
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    size_t mappedSize;
};
