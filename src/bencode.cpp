#include "bencode.hpp"

#include <utility>

namespace shoal {

std::string bencode_number(const int64_t n)
{
    return 'i' + std::to_string(n) + 'e';
}

std::string bencode_string(std::string_view s)
{
    std::string result = std::to_string(s.length());
    result.reserve(result.length() + 1 + s.length());
    result += ':';
    result.append(s.data(), s.length());
    return result;
}

// ------------------
// -- bmap_encoder --
// ------------------

bmap_encoder::value& bmap_encoder::value::operator=(const int64_t n)
{
    encoded_ = bencode_number(n);
    return *this;
}

bmap_encoder::value& bmap_encoder::value::operator=(const char* s)
{
    encoded_ = bencode_string(s);
    return *this;
}

bmap_encoder::value& bmap_encoder::value::operator=(const std::string& s)
{
    encoded_ = bencode_string(s);
    return *this;
}

bmap_encoder::value& bmap_encoder::value::operator=(const blist_encoder& l)
{
    encoded_ = l.encode();
    return *this;
}

std::string bmap_encoder::encode() const
{
    std::string result;
    result.reserve(encoded_length());
    result += 'd';
    for(const auto& entry : entries_) {
        result += bencode_string(entry.first);
        result += entry.second.encoded_;
    }
    result += 'e';
    return result;
}

int bmap_encoder::encoded_length() const
{
    int length = 2;
    for(const auto& entry : entries_) {
        const int key_length = entry.first.length();
        length += std::to_string(key_length).length() + 1 + key_length;
        length += entry.second.encoded_.length();
    }
    return length;
}

// -------------------
// -- blist_encoder --
// -------------------

void blist_encoder::push_back(const int64_t n)
{
    append(bencode_number(n));
}

void blist_encoder::push_back(std::string_view s)
{
    append(bencode_string(s));
}

void blist_encoder::push_back(const blist_encoder& l)
{
    append(l.encode());
}

void blist_encoder::append(std::string encoded)
{
    num_bytes_ += encoded.length();
    items_.emplace_back(std::move(encoded));
}

std::string blist_encoder::encode() const
{
    std::string result;
    result.reserve(num_bytes_);
    result += 'l';
    for(const auto& item : items_) {
        result += item;
    }
    result += 'e';
    return result;
}

} // namespace shoal
