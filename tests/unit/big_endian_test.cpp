#include "BigEndian.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>

namespace
{

using credhash::core::detail::g_kU32Bytes;
using credhash::core::detail::readU32BE;
using credhash::core::detail::writeU32BE;

} // namespace

TEST(BigEndian, WritesMostSignificantByteFirst)
{
    std::array<std::byte, g_kU32Bytes> out{};
    writeU32BE(std::span{ out }, 0x00002710U);

    EXPECT_EQ(out[0], std::byte{ 0x00 });
    EXPECT_EQ(out[1], std::byte{ 0x00 });
    EXPECT_EQ(out[2], std::byte{ 0x27 });
    EXPECT_EQ(out[3], std::byte{ 0x10 });
}

TEST(BigEndian, ReadsMostSignificantByteFirst)
{
    const std::array<std::byte, g_kU32Bytes> in{ std::byte{ 0x01 }, std::byte{ 0x02 }, std::byte{ 0x03 },
                                                 std::byte{ 0x04 } };
    EXPECT_EQ(readU32BE(std::span{ in }), 0x01020304U);
}

TEST(BigEndian, ExtremesSurviveWriteThenRead)
{
    for (const std::uint32_t v : { 0U, 1U, 0xFFU, 0x100U, 0x7FFFFFFFU, 0xFFFFFFFFU })
    {
        std::array<std::byte, g_kU32Bytes> buf{};
        writeU32BE(std::span{ buf }, v);
        EXPECT_EQ(readU32BE(std::span<const std::byte, g_kU32Bytes>{ buf }), v);
    }
}

