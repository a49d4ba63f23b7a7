#ifndef SHOAL_BENCODE_HEADER
#define SHOAL_BENCODE_HEADER

#include <string_view>
#include <cstdint>
#include <string>
#include <vector>
#include <map>

namespace shoal {

std::string bencode_string(std::string_view s);
std::string bencode_number(const int64_t n);

class blist_encoder;

/**
 * Builds a bencoded dictionary. Resume data and the hash store snapshot are written
 * with this, e.g.:
 *
 * bmap_encoder resume;
 * resume["file"] = file.name;
 * resume["size"] = file.size;
 * const std::string encoded = resume.encode();
 */
class bmap_encoder
{
    // Holds the already encoded value of an entry.
    class value
    {
        friend class bmap_encoder;
        std::string encoded_;
    public:
        value& operator=(const int64_t n);
        value& operator=(const char* s);
        value& operator=(const std::string& s);
        value& operator=(const blist_encoder& l);
    };

    // Keys must be emitted in lexicographical order, which std::map gives for free.
    std::map<std::string, value> entries_;

public:

    value& operator[](const std::string& key) { return entries_[key]; }

    std::string encode() const;
    int encoded_length() const;
};

class blist_encoder
{
    std::vector<std::string> items_;
    // 'l' and 'e'
    int num_bytes_ = 2;

public:

    void push_back(const int64_t n);
    void push_back(std::string_view s);
    void push_back(const blist_encoder& l);

    int size() const noexcept { return items_.size(); }
    bool empty() const noexcept { return items_.empty(); }

    std::string encode() const;
    int encoded_length() const noexcept { return num_bytes_; }

private:

    void append(std::string encoded);
};

} // namespace shoal

#endif // SHOAL_BENCODE_HEADER
