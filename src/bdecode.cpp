#include "bdecode.hpp"

#include <stdexcept>
#include <cctype>

namespace shoal {

std::string bencode_error_category::message(int env) const
{
    switch(static_cast<bencode_errc>(env))
    {
    case bencode_errc::unknown: return "Unknown";
    case bencode_errc::unexpected_end: return "Unexpected end of bencoded input";
    case bencode_errc::invalid_token: return "Invalid bencode token";
    case bencode_errc::invalid_number: return "Invalid bencoded number";
    case bencode_errc::invalid_string_length: return "Invalid bencoded string length";
    case bencode_errc::invalid_map_key: return "Bencoded dictionary key is not a string";
    case bencode_errc::nesting_too_deep: return "Bencoded containers nested too deep";
    case bencode_errc::trailing_data: return "Trailing data after bencoded element";
    case bencode_errc::unexpected_type: return "Unexpected bencoded element type";
    default: return "Unknown";
    }
}

const bencode_error_category& bencode_category()
{
    static bencode_error_category instance;
    return instance;
}

std::error_code make_error_code(bencode_errc e)
{
    return std::error_code(static_cast<int>(e), bencode_category());
}

// ----------
// -- blist --
// ----------

std::vector<int64_t> blist::all_numbers() const
{
    std::vector<int64_t> result;
    for(const auto& e : elements_) {
        if(e->type() == btype::number) {
            result.push_back(static_cast<const bnumber&>(*e).value);
        }
    }
    return result;
}

std::vector<std::string> blist::all_strings() const
{
    std::vector<std::string> result;
    for(const auto& e : elements_) {
        if(e->type() == btype::string) {
            result.push_back(static_cast<const bstring&>(*e).value);
        }
    }
    return result;
}

std::vector<blist> blist::all_blists() const
{
    std::vector<blist> result;
    for(const auto& e : elements_) {
        if(e->type() == btype::list) {
            result.push_back(static_cast<const blist&>(*e));
        }
    }
    return result;
}

std::vector<bmap> blist::all_bmaps() const
{
    std::vector<bmap> result;
    for(const auto& e : elements_) {
        if(e->type() == btype::map) {
            result.push_back(static_cast<const bmap&>(*e));
        }
    }
    return result;
}

// ---------
// -- bmap --
// ---------

const belement* bmap::find(const std::string& key, const btype type) const
{
    auto it = elements_.find(key);
    if((it == elements_.end()) || (it->second->type() != type)) {
        return nullptr;
    }
    return it->second.get();
}

int64_t bmap::find_number(const std::string& key) const
{
    int64_t result;
    if(try_find_number(key, result)) {
        return result;
    }
    throw std::invalid_argument(key + " not in bmap");
}

bool bmap::try_find_number(const std::string& key, int64_t& result) const
{
    const auto e = find(key, btype::number);
    if(e == nullptr) {
        return false;
    }
    result = static_cast<const bnumber*>(e)->value;
    return true;
}

std::string bmap::find_string(const std::string& key) const
{
    std::string result;
    if(try_find_string(key, result)) {
        return result;
    }
    throw std::invalid_argument(key + " not in bmap");
}

bool bmap::try_find_string(const std::string& key, std::string& result) const
{
    const auto e = find(key, btype::string);
    if(e == nullptr) {
        return false;
    }
    result = static_cast<const bstring*>(e)->value;
    return true;
}

blist bmap::find_blist(const std::string& key) const
{
    blist result;
    if(try_find_blist(key, result)) {
        return result;
    }
    throw std::invalid_argument(key + " not in bmap");
}

bool bmap::try_find_blist(const std::string& key, blist& result) const
{
    const auto e = find(key, btype::list);
    if(e == nullptr) {
        return false;
    }
    result = *static_cast<const blist*>(e);
    return true;
}

bmap bmap::find_bmap(const std::string& key) const
{
    bmap result;
    if(try_find_bmap(key, result)) {
        return result;
    }
    throw std::invalid_argument(key + " not in bmap");
}

bool bmap::try_find_bmap(const std::string& key, bmap& result) const
{
    const auto e = find(key, btype::map);
    if(e == nullptr) {
        return false;
    }
    result = *static_cast<const bmap*>(e);
    return true;
}

// --------------
// -- decoding --
// --------------

namespace {

constexpr int max_nesting_depth = 64;

class decoder
{
    const std::string& source_;
    int pos_ = 0;

public:

    explicit decoder(const std::string& s) : source_(s) {}

    bool at_end() const noexcept { return pos_ >= int(source_.length()); }

    std::unique_ptr<belement> decode_element(int depth, std::error_code& error)
    {
        if(at_end()) {
            error = bencode_errc::unexpected_end;
            return nullptr;
        }
        const char c = source_[pos_];
        if(c == 'i') {
            int64_t n;
            if(!decode_number(n, error)) { return nullptr; }
            return std::make_unique<bnumber>(n);
        } else if(std::isdigit(static_cast<unsigned char>(c))) {
            std::string s;
            if(!decode_string(s, error)) { return nullptr; }
            return std::make_unique<bstring>(std::move(s));
        } else if(c == 'l') {
            return decode_list(depth + 1, error);
        } else if(c == 'd') {
            return decode_map(depth + 1, error);
        }
        error = bencode_errc::invalid_token;
        return nullptr;
    }

private:

    bool decode_number(int64_t& n, std::error_code& error)
    {
        // skip 'i'
        ++pos_;
        const auto end = source_.find('e', pos_);
        if(end == std::string::npos) {
            error = bencode_errc::unexpected_end;
            return false;
        }
        const std::string digits = source_.substr(pos_, end - pos_);
        if(!is_valid_number(digits)) {
            error = bencode_errc::invalid_number;
            return false;
        }
        try {
            n = std::stoll(digits);
        } catch(const std::out_of_range&) {
            error = bencode_errc::invalid_number;
            return false;
        }
        pos_ = end + 1;
        return true;
    }

    static bool is_valid_number(const std::string& s)
    {
        if(s.empty()) { return false; }
        int i = s[0] == '-' ? 1 : 0;
        if(i == int(s.length())) { return false; }
        // leading zeros (and negative zero) are not allowed
        if((s[i] == '0') && (s.length() > 1)) { return false; }
        for(; i < int(s.length()); ++i) {
            if(!std::isdigit(static_cast<unsigned char>(s[i]))) { return false; }
        }
        return true;
    }

    bool decode_string(std::string& s, std::error_code& error)
    {
        const auto colon = source_.find(':', pos_);
        if(colon == std::string::npos) {
            error = bencode_errc::unexpected_end;
            return false;
        }
        const std::string header = source_.substr(pos_, colon - pos_);
        if(header.empty() || (header.length() > 10) || !is_valid_number(header)
                || (header[0] == '-')) {
            error = bencode_errc::invalid_string_length;
            return false;
        }
        const int64_t length = std::stoll(header);
        const int64_t begin = colon + 1;
        if(begin + length > int64_t(source_.length())) {
            error = bencode_errc::invalid_string_length;
            return false;
        }
        s = source_.substr(begin, length);
        pos_ = begin + length;
        return true;
    }

    std::unique_ptr<belement> decode_list(int depth, std::error_code& error)
    {
        if(depth > max_nesting_depth) {
            error = bencode_errc::nesting_too_deep;
            return nullptr;
        }
        // skip 'l'
        ++pos_;
        auto list = std::make_unique<blist>();
        while(!at_end() && (source_[pos_] != 'e')) {
            auto e = decode_element(depth, error);
            if(error) { return nullptr; }
            list->push_back(std::move(e));
        }
        if(at_end()) {
            error = bencode_errc::unexpected_end;
            return nullptr;
        }
        // skip 'e'
        ++pos_;
        return list;
    }

    std::unique_ptr<belement> decode_map(int depth, std::error_code& error)
    {
        if(depth > max_nesting_depth) {
            error = bencode_errc::nesting_too_deep;
            return nullptr;
        }
        // skip 'd'
        ++pos_;
        auto map = std::make_unique<bmap>();
        while(!at_end() && (source_[pos_] != 'e')) {
            if(!std::isdigit(static_cast<unsigned char>(source_[pos_]))) {
                error = bencode_errc::invalid_map_key;
                return nullptr;
            }
            std::string key;
            if(!decode_string(key, error)) { return nullptr; }
            auto value = decode_element(depth, error);
            if(error) { return nullptr; }
            map->insert(std::move(key), std::move(value));
        }
        if(at_end()) {
            error = bencode_errc::unexpected_end;
            return nullptr;
        }
        // skip 'e'
        ++pos_;
        return map;
    }
};

} // namespace

std::unique_ptr<belement> decode(const std::string& s, std::error_code& error)
{
    error.clear();
    decoder d(s);
    auto root = d.decode_element(0, error);
    if(error) {
        return nullptr;
    }
    if(!d.at_end()) {
        error = bencode_errc::trailing_data;
        return nullptr;
    }
    return root;
}

bmap decode_bmap(const std::string& s, std::error_code& error)
{
    auto root = decode(s, error);
    if(error) {
        return {};
    }
    if(root->type() != btype::map) {
        error = bencode_errc::unexpected_type;
        return {};
    }
    return std::move(static_cast<bmap&>(*root));
}

bmap decode_bmap(const std::string& s)
{
    std::error_code error;
    bmap map = decode_bmap(s, error);
    if(error) {
        throw std::system_error(error);
    }
    return map;
}

} // namespace shoal
