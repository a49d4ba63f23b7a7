#include <shoal/bencode.hpp>
#include <shoal/bdecode.hpp>
#include <gtest/gtest.h>

#include <system_error>
#include <stdexcept>
#include <utility>
#include <string>

using namespace shoal;

TEST(BencodeTest, EncodeScalars)
{
    EXPECT_EQ(bencode_number(42), "i42e");
    EXPECT_EQ(bencode_number(-7), "i-7e");
    EXPECT_EQ(bencode_string("spam"), "4:spam");
    EXPECT_EQ(bencode_string(""), "0:");
}

TEST(BencodeTest, MapKeysAreSorted)
{
    bmap_encoder map;
    map["zebra"] = 1;
    map["apple"] = "fruit";
    blist_encoder list;
    list.push_back(1);
    list.push_back(std::string_view("two"));
    map["list"] = list;

    const auto encoded = map.encode();
    EXPECT_EQ(encoded, "d5:apple5:fruit4:listli1e3:twoe5:zebrai1ee");
    EXPECT_EQ(map.encoded_length(), int(encoded.length()));
    EXPECT_EQ(list.encoded_length(), int(list.encode().length()));
}

TEST(BencodeTest, DecodeResumeData)
{
    const std::string digest(32, '\xab');
    bmap_encoder resume;
    resume["file"] = "@@share\\album\\track.flac";
    resume["size"] = int64_t(10) * 1024 * 1024;
    resume["segment_size"] = 1024 * 1024;
    blist_encoder verified;
    verified.push_back(0);
    verified.push_back(3);
    blist_encoder digests;
    digests.push_back(std::string_view(digest));
    digests.push_back(std::string_view(digest));
    resume["verified_segments"] = verified;
    resume["segment_digests"] = digests;

    const bmap decoded = decode_bmap(resume.encode());
    EXPECT_EQ(decoded.find_string("file"), "@@share\\album\\track.flac");
    EXPECT_EQ(decoded.find_number("size"), 10 * 1024 * 1024);
    EXPECT_EQ(decoded.find_number("segment_size"), 1024 * 1024);
    const auto indices = decoded.find_blist("verified_segments").all_numbers();
    ASSERT_EQ(indices.size(), 2);
    EXPECT_EQ(indices[1], 3);
    const auto strings = decoded.find_blist("segment_digests").all_strings();
    ASSERT_EQ(strings.size(), 2);
    EXPECT_EQ(strings[0], digest);

    int64_t n;
    EXPECT_FALSE(decoded.try_find_number("missing", n));
    EXPECT_FALSE(decoded.try_find_number("file", n));
    EXPECT_THROW(decoded.find_number("file"), std::invalid_argument);
}

TEST(BencodeTest, NestedContainers)
{
    std::error_code error;
    const auto root = decode("d1:ald1:xi1eeee", error);
    ASSERT_FALSE(error);
    ASSERT_EQ(root->type(), btype::map);
    const auto& map = static_cast<const bmap&>(*root);
    const auto list = map.find_blist("a");
    ASSERT_EQ(list.size(), 1);
    const auto maps = list.all_bmaps();
    ASSERT_EQ(maps.size(), 1);
    EXPECT_EQ(maps[0].find_number("x"), 1);
}

TEST(BencodeTest, MalformedInputIsRejected)
{
    const std::pair<std::string, bencode_errc> cases[] = {
        {"", bencode_errc::unexpected_end},
        {"i12", bencode_errc::unexpected_end},
        {"i-e", bencode_errc::invalid_number},
        {"i012e", bencode_errc::invalid_number},
        {"5:abc", bencode_errc::invalid_string_length},
        {"l", bencode_errc::unexpected_end},
        {"di1ei2ee", bencode_errc::invalid_map_key},
        {"x", bencode_errc::invalid_token},
        {"i1ei2e", bencode_errc::trailing_data},
    };
    for(const auto& c : cases) {
        std::error_code error;
        EXPECT_FALSE(decode(c.first, error)) << c.first;
        EXPECT_EQ(error, c.second) << c.first;
    }

    std::error_code error;
    decode_bmap("li1ee", error);
    EXPECT_EQ(error, bencode_errc::unexpected_type);
    EXPECT_THROW(decode_bmap("d"), std::system_error);
}

TEST(BencodeTest, DeepNestingIsRejected)
{
    std::string deep(100, 'l');
    deep.append(100, 'e');
    std::error_code error;
    EXPECT_FALSE(decode(deep, error));
    EXPECT_EQ(error, bencode_errc::nesting_too_deep);
}
