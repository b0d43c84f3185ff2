#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rxdnssd
{

// DNS-SD TXT record (RFC 6763 section 6): a sequence of length prefixed
// "key=value" strings. A key without '=' is present with no value.
class TxtRecord
{
public:
    struct Entry
    {
        std::string key;
        std::optional<std::string> value;
    };

    using const_iterator = std::vector<Entry>::const_iterator;

    TxtRecord() = default;
    explicit TxtRecord(const std::map<std::string, std::string>& entries);

    // Adds or replaces an entry. Throws DiscoveryError(BadParam) for an empty key,
    // a key containing '=' or non printable characters, or an entry over 255 bytes.
    void Set(const std::string& key, const std::string& value);
    void Set(const std::string& key);

    bool Remove(const std::string& key);

    [[nodiscard]] bool Contains(const std::string& key) const;
    // Value of the key, empty when the key is missing or has no value.
    [[nodiscard]] std::optional<std::string> Get(const std::string& key) const;

    [[nodiscard]] std::size_t Size() const { return m_entries.size(); }
    [[nodiscard]] bool Empty() const { return m_entries.empty(); }
    [[nodiscard]] const_iterator begin() const { return m_entries.begin(); }
    [[nodiscard]] const_iterator end() const { return m_entries.end(); }

    // Absent values become empty strings.
    [[nodiscard]] std::map<std::string, std::string> ToMap() const;

    // An empty record encodes as a single empty string, as required on the wire.
    [[nodiscard]] std::vector<std::uint8_t> Encode() const;

    // Throws DiscoveryError(BadTxtRecord) when a length prefix runs past the end.
    static TxtRecord Decode(const std::uint8_t* data, std::size_t size);
    static TxtRecord Decode(const std::vector<std::uint8_t>& data);

private:
    void SetEntry(Entry entry);
    [[nodiscard]] std::vector<Entry>::iterator Find(const std::string& key);
    [[nodiscard]] std::vector<Entry>::const_iterator Find(const std::string& key) const;

    std::vector<Entry> m_entries;
};

std::vector<std::uint8_t> EncodeTxtRecord(const std::map<std::string, std::string>& entries);
std::map<std::string, std::string> DecodeTxtRecord(const std::vector<std::uint8_t>& data);

}
