#pragma once

#include <batchgrader/common/expected.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace batchgrader {

/// Maps a submission filename to the identifier of whoever submitted it.
/// Implementations must be pure: the same filename always maps to the same identifier.
class IdentifierResolver
{
public:
    virtual ~IdentifierResolver() = default;

    /// \throws IdentifierResolutionError if ``filename`` has no known identifier
    virtual std::string file_to_id(std::string_view filename) const = 0;
};

/// Resolver backed by an in-memory filename -> identifier table
class MapIdentifierResolver : public IdentifierResolver
{
public:
    MapIdentifierResolver() = default;

    explicit MapIdentifierResolver(std::map<std::string, std::string, std::less<>> ids);

    std::string file_to_id(std::string_view filename) const override;

    std::size_t size() const noexcept { return ids_.size(); }

private:
    std::map<std::string, std::string, std::less<>> ids_;
};

/// Reads an identifier map from a CSV file of newline-separated "filename,identifier" entries, utf-8 encoded.
/// Fields holding commas are quoted. Empty lines are skipped; a header line "file,identifier" is allowed.
Expected<MapIdentifierResolver, std::string> load_identifier_map(const std::filesystem::path& path);

} // namespace batchgrader
