#include "VectorTable.hpp"
#include "../text/UnicodeNormalizer.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <bit>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>

namespace philoglot::embeddings
{

namespace
{

struct Header
{
    std::size_t count = 0;
    std::size_t dimensions = 0;
};

bool parseSize(std::string_view field, std::size_t& out)
{
    if (field.empty())
        return false;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    return ec == std::errc() && ptr == field.data() + field.size();
}

std::vector<std::string_view> splitFields(std::string_view line)
{
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (pos < line.size())
    {
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t'))
            ++pos;
        if (pos >= line.size())
            break;
        std::size_t end = pos;
        while (end < line.size() && line[end] != ' ' && line[end] != '\t')
            ++end;
        fields.push_back(line.substr(pos, end - pos));
        pos = end;
    }
    return fields;
}

std::optional<Header> parseHeader(std::string_view line)
{
    auto fields = splitFields(line);
    if (fields.size() != 2)
        return std::nullopt;
    Header header;
    if (!parseSize(fields[0], header.count) || !parseSize(fields[1], header.dimensions))
        return std::nullopt;
    if (header.dimensions == 0)
        return std::nullopt;
    return header;
}

[[noreturn]] void fail(const std::filesystem::path& path, const std::string& reason)
{
    throw BackendError("vector file " + path.string() + ": " + reason);
}

// Published models stay well below this; anything larger is a corrupt header.
constexpr std::size_t kMaxDimensions = 65536;

void validateHeader(const std::filesystem::path& path, const Header& header)
{
    if (header.dimensions > kMaxDimensions)
    {
        fail(path, "header announces " + std::to_string(header.dimensions) + " dimensions, limit is " +
                       std::to_string(kMaxDimensions));
    }
    if (header.count > std::numeric_limits<std::size_t>::max() / header.dimensions)
        fail(path, "header announces more values than can be addressed");
}

// Rows the file can hold at most, given the smallest possible encoding of one
// row. Used to bound reservations so a corrupt header cannot force a huge
// allocation before the truncation is detected.
std::size_t plausibleRows(const std::filesystem::path& path, const Header& header, std::size_t min_row_bytes)
{
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path, ec);
    if (ec)
        return 0;
    return std::min<std::size_t>(header.count, static_cast<std::size_t>(file_size) / min_row_bytes);
}

// word2vec writes raw host-order float32; published models come from
// little-endian machines.
float readLittleEndianFloat(const char* bytes)
{
    std::uint32_t bits = 0;
    std::memcpy(&bits, bytes, sizeof(bits));
    if constexpr (std::endian::native == std::endian::big)
    {
        bits = ((bits & 0x000000FFu) << 24) | ((bits & 0x0000FF00u) << 8) | ((bits & 0x00FF0000u) >> 8) |
               ((bits & 0xFF000000u) >> 24);
    }
    float value = 0.0F;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // namespace

VectorTable::VectorTable(std::size_t dimensions)
    : dimensions_(dimensions)
{
}

VectorTable VectorTable::loadText(const std::filesystem::path& path)
{
    PROFILE_SCOPE_FUNCTION();

    std::ifstream in(path);
    if (!in.is_open())
        fail(path, "cannot open file");

    std::string line;
    if (!std::getline(in, line))
        fail(path, "empty file");
    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    auto header = parseHeader(line);
    if (!header)
        fail(path, "malformed header '" + utils::Diagnostics::Preview(line) + "'");

    validateHeader(path, *header);

    // Smallest text row: one-byte token, then " 0" per dimension and a newline.
    const std::size_t reserve_rows = plausibleRows(path, *header, 2 * header->dimensions + 2);
    VectorTable table(header->dimensions);
    table.data_.reserve(reserve_rows * header->dimensions);
    table.index_.reserve(reserve_rows);

    std::size_t line_no = 1;
    std::size_t rows = 0;
    std::size_t duplicates = 0;
    std::size_t invalid = 0;
    Vector values(header->dimensions);
    while (rows < header->count && std::getline(in, line))
    {
        ++line_no;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        auto fields = splitFields(line);
        if (fields.size() != header->dimensions + 1)
        {
            fail(path, "line " + std::to_string(line_no) + " has " + std::to_string(fields.size() - 1) +
                           " values, expected " + std::to_string(header->dimensions));
        }

        for (std::size_t i = 0; i < header->dimensions; ++i)
        {
            const std::string_view field = fields[i + 1];
            auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), values[i]);
            if (ec != std::errc() || ptr != field.data() + field.size())
                fail(path, "line " + std::to_string(line_no) + " has a non-numeric value");
        }

        if (!text::is_valid_utf8(fields[0]))
            ++invalid;
        else if (!table.insert(fields[0], values))
            ++duplicates;
        ++rows;
    }

    if (rows < header->count)
    {
        fail(path, "truncated: header announces " + std::to_string(header->count) + " vectors, found " +
                       std::to_string(rows));
    }

    PLOG_INFO << "Loaded " << table.size() << " vectors (" << table.dimensions() << " dims) from " << path.string();
    if (duplicates > 0)
        PLOG_WARNING << "Skipped " << duplicates << " duplicate tokens in " << path.string();
    if (invalid > 0)
        PLOG_WARNING << "Skipped " << invalid << " tokens with invalid UTF-8 in " << path.string();
    return table;
}

VectorTable VectorTable::loadWord2VecBinary(const std::filesystem::path& path)
{
    PROFILE_SCOPE_FUNCTION();

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        fail(path, "cannot open file");

    std::string line;
    if (!std::getline(in, line))
        fail(path, "empty file");
    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    auto header = parseHeader(line);
    if (!header)
        fail(path, "malformed header '" + utils::Diagnostics::Preview(line) + "'");

    validateHeader(path, *header);

    // Smallest binary row: one-byte token, a space, then the float32 values.
    const std::size_t reserve_rows = plausibleRows(path, *header, header->dimensions * sizeof(float) + 2);
    VectorTable table(header->dimensions);
    table.data_.reserve(reserve_rows * header->dimensions);
    table.index_.reserve(reserve_rows);

    std::vector<char> raw(header->dimensions * sizeof(float));
    Vector values(header->dimensions);
    std::string token;
    std::size_t duplicates = 0;
    std::size_t invalid = 0;

    for (std::size_t row = 0; row < header->count; ++row)
    {
        token.clear();
        char c = 0;
        while (in.get(c))
        {
            if (c == ' ')
                break;
            // Entries written by the reference tool end with '\n'
            if (c == '\n' && token.empty())
                continue;
            token.push_back(c);
        }
        if (!in || token.empty())
        {
            fail(path, "truncated: header announces " + std::to_string(header->count) + " vectors, found " +
                           std::to_string(row));
        }

        if (!in.read(raw.data(), static_cast<std::streamsize>(raw.size())))
            fail(path, "truncated vector for token '" + utils::Diagnostics::Preview(token) + "'");
        for (std::size_t i = 0; i < header->dimensions; ++i)
            values[i] = readLittleEndianFloat(raw.data() + i * sizeof(float));

        if (!text::is_valid_utf8(token))
            ++invalid;
        else if (!table.insert(token, values))
            ++duplicates;
    }

    PLOG_INFO << "Loaded " << table.size() << " vectors (" << table.dimensions() << " dims) from " << path.string();
    if (duplicates > 0)
        PLOG_WARNING << "Skipped " << duplicates << " duplicate tokens in " << path.string();
    if (invalid > 0)
        PLOG_WARNING << "Skipped " << invalid << " tokens with invalid UTF-8 in " << path.string();
    return table;
}

bool VectorTable::insert(std::string_view token, const Vector& values)
{
    if (values.size() != dimensions_)
        return false;

    std::string key = text::to_nfc(token);
    auto [it, inserted] = index_.try_emplace(std::move(key), index_.size());
    if (!inserted)
        return false;

    data_.insert(data_.end(), values.begin(), values.end());
    return true;
}

std::optional<Vector> VectorTable::lookup(std::string_view token) const
{
    auto it = index_.find(text::to_nfc(token));
    if (it == index_.end())
        return std::nullopt;

    const auto offset = static_cast<std::ptrdiff_t>(it->second * dimensions_);
    return Vector(data_.begin() + offset, data_.begin() + offset + static_cast<std::ptrdiff_t>(dimensions_));
}

bool VectorTable::contains(std::string_view token) const
{
    return index_.find(text::to_nfc(token)) != index_.end();
}

} // namespace philoglot::embeddings
