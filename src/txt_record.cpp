#include "rxdnssd/txt_record.hpp"
#include "rxdnssd/types.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace rxdnssd
{

namespace
{

constexpr std::size_t kMaxEntryLength = 255;

void ValidateKey(const std::string& key)
{
    if (key.empty()) {
        throw DiscoveryError(ErrorCode::BadParam, "TXT record key must not be empty");
    }
    for (const char c : key) {
        if (c == '=' || c < 0x20 || c > 0x7e) {
            throw DiscoveryError(ErrorCode::BadParam, fmt::format("Invalid character in TXT record key \"{}\"", key));
        }
    }
}

std::size_t EntryLength(const TxtRecord::Entry& entry)
{
    return entry.key.size() + (entry.value ? entry.value->size() + 1 : 0);
}

}

TxtRecord::TxtRecord(const std::map<std::string, std::string>& entries)
{
    for (const auto& [key, value] : entries) {
        Set(key, value);
    }
}

void TxtRecord::Set(const std::string& key, const std::string& value)
{
    SetEntry(Entry{key, value});
}

void TxtRecord::Set(const std::string& key)
{
    SetEntry(Entry{key, std::nullopt});
}

void TxtRecord::SetEntry(Entry entry)
{
    ValidateKey(entry.key);
    if (EntryLength(entry) > kMaxEntryLength) {
        throw DiscoveryError(ErrorCode::BadParam, fmt::format("TXT record entry \"{}\" exceeds {} bytes", entry.key, kMaxEntryLength));
    }

    auto it = Find(entry.key);
    if (it != m_entries.end()) {
        it->value = std::move(entry.value);
    } else {
        m_entries.push_back(std::move(entry));
    }
}

bool TxtRecord::Remove(const std::string& key)
{
    auto it = Find(key);
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

bool TxtRecord::Contains(const std::string& key) const
{
    return Find(key) != m_entries.end();
}

std::optional<std::string> TxtRecord::Get(const std::string& key) const
{
    auto it = Find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->value;
}

std::map<std::string, std::string> TxtRecord::ToMap() const
{
    std::map<std::string, std::string> result;
    for (const auto& entry : m_entries) {
        result.emplace(entry.key, entry.value.value_or(""));
    }
    return result;
}

std::vector<std::uint8_t> TxtRecord::Encode() const
{
    std::vector<std::uint8_t> data;
    if (m_entries.empty()) {
        data.push_back(0);
        return data;
    }

    for (const auto& entry : m_entries) {
        data.push_back(static_cast<std::uint8_t>(EntryLength(entry)));
        data.insert(data.end(), entry.key.begin(), entry.key.end());
        if (entry.value) {
            data.push_back('=');
            data.insert(data.end(), entry.value->begin(), entry.value->end());
        }
    }
    return data;
}

TxtRecord TxtRecord::Decode(const std::uint8_t* data, std::size_t size)
{
    TxtRecord record;
    std::size_t offset = 0;
    while (offset < size) {
        const std::size_t length = data[offset++];
        if (offset + length > size) {
            throw DiscoveryError(ErrorCode::BadTxtRecord, fmt::format("TXT string of {} bytes at offset {} overruns {} byte record", length, offset - 1, size));
        }
        const std::string string(reinterpret_cast<const char*>(data + offset), length);
        offset += length;

        // Empty strings and strings without a key carry nothing
        const auto separator = string.find('=');
        if (string.empty() || separator == 0) {
            continue;
        }

        Entry entry;
        if (separator == std::string::npos) {
            entry.key = string;
        } else {
            entry.key = string.substr(0, separator);
            entry.value = string.substr(separator + 1);
        }
        // The first occurrence of a key wins
        if (!record.Contains(entry.key)) {
            record.m_entries.push_back(std::move(entry));
        }
    }
    return record;
}

TxtRecord TxtRecord::Decode(const std::vector<std::uint8_t>& data)
{
    return Decode(data.data(), data.size());
}

std::vector<TxtRecord::Entry>::iterator TxtRecord::Find(const std::string& key)
{
    return std::find_if(m_entries.begin(), m_entries.end(), [&key](const Entry& entry) {
        return entry.key == key;
    });
}

std::vector<TxtRecord::Entry>::const_iterator TxtRecord::Find(const std::string& key) const
{
    return std::find_if(m_entries.begin(), m_entries.end(), [&key](const Entry& entry) {
        return entry.key == key;
    });
}

std::vector<std::uint8_t> EncodeTxtRecord(const std::map<std::string, std::string>& entries)
{
    return TxtRecord(entries).Encode();
}

std::map<std::string, std::string> DecodeTxtRecord(const std::vector<std::uint8_t>& data)
{
    return TxtRecord::Decode(data).ToMap();
}

}
