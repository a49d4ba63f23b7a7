#ifndef SHOAL_BDECODE_HEADER
#define SHOAL_BDECODE_HEADER

#include <system_error>
#include <cstdint>
#include <string>
#include <memory>
#include <vector>
#include <map>

namespace shoal {

enum class bencode_errc
{
    unknown = 1,
    // The input ended before the current element was closed.
    unexpected_end,
    // A character that can't start or continue an element was found.
    invalid_token,
    // A number element is not of the form i<digits>e.
    invalid_number,
    // A string's length header is malformed or points past the input.
    invalid_string_length,
    // A dictionary key is not a string.
    invalid_map_key,
    // Containers are nested more deeply than we're willing to follow.
    nesting_too_deep,
    // Trailing bytes after the root element.
    trailing_data,
    // The root element is not of the requested type.
    unexpected_type
};

struct bencode_error_category : public std::error_category
{
    const char* name() const noexcept override { return "bencode"; }
    std::string message(int env) const override;
};

const bencode_error_category& bencode_category();
std::error_code make_error_code(bencode_errc e);

/** All the possible bencoded types. */
enum class btype
{
    // Encoded format: i<number>e, e.g.: i3244e
    number,
    // Encoded format: <len(str)>:<str>, e.g.: 6:string
    string,
    // Encoded format: l<elements>e, e.g.: l4:abcdi53452eli234ei234eee
    list,
    // Encoded format: d<<(str)key><value> pairs>e, and keys must be in lexicographical
    // order, e.g.: d4:eggsi324e4:spami432ee
    map
};

/**
 * The documents we decode (resume data and the hash store snapshot) are small and are
 * read once on startup, so they are parsed into a tree of owned elements.
 */
struct belement
{
    virtual ~belement() = default;
    virtual btype type() const noexcept = 0;
};

struct bnumber final : public belement
{
    int64_t value = 0;
    explicit bnumber(int64_t n) : value(n) {}
    btype type() const noexcept override { return btype::number; }
};

struct bstring final : public belement
{
    std::string value;
    explicit bstring(std::string s) : value(std::move(s)) {}
    btype type() const noexcept override { return btype::string; }
};

class bmap;

class blist final : public belement
{
    std::vector<std::shared_ptr<const belement>> elements_;

public:

    btype type() const noexcept override { return btype::list; }

    int size() const noexcept { return elements_.size(); }
    bool empty() const noexcept { return elements_.empty(); }

    const belement& operator[](const int i) const { return *elements_[i]; }

    void push_back(std::shared_ptr<const belement> e) { elements_.push_back(std::move(e)); }

    /** Returns all numbers in this list, skipping elements of other types. */
    std::vector<int64_t> all_numbers() const;

    /** Returns all strings in this list, skipping elements of other types. */
    std::vector<std::string> all_strings() const;

    /** Returns all lists in this list, skipping elements of other types. */
    std::vector<blist> all_blists() const;

    /** Returns all maps in this list, skipping elements of other types. */
    std::vector<bmap> all_bmaps() const;
};

class bmap final : public belement
{
    std::map<std::string, std::shared_ptr<const belement>> elements_;

public:

    btype type() const noexcept override { return btype::map; }

    int size() const noexcept { return elements_.size(); }
    bool empty() const noexcept { return elements_.empty(); }

    void insert(std::string key, std::shared_ptr<const belement> e)
    {
        elements_.emplace(std::move(key), std::move(e));
    }

    /** The find_ functions throw std::invalid_argument if key or type doesn't match. */
    int64_t find_number(const std::string& key) const;
    bool try_find_number(const std::string& key, int64_t& result) const;

    std::string find_string(const std::string& key) const;
    bool try_find_string(const std::string& key, std::string& result) const;

    blist find_blist(const std::string& key) const;
    bool try_find_blist(const std::string& key, blist& result) const;

    bmap find_bmap(const std::string& key) const;
    bool try_find_bmap(const std::string& key, bmap& result) const;

private:

    const belement* find(const std::string& key, const btype type) const;
};

/**
 * Decodes a bencoded dictionary into a bmap instance. On failure error is set and an
 * empty map is returned.
 */
bmap decode_bmap(const std::string& s, std::error_code& error);

/** Same as above but throws std::system_error on failure. */
bmap decode_bmap(const std::string& s);

/**
 * Returns one of the four bencode types, or nullptr (with error set) if s is not a
 * valid bencoded element.
 */
std::unique_ptr<belement> decode(const std::string& s, std::error_code& error);

} // namespace shoal

namespace std
{
    template<> struct is_error_code_enum<shoal::bencode_errc> : public true_type {};
}

#endif // SHOAL_BDECODE_HEADER
