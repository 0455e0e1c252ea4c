/**
 * @file test_bit_packed_reader.cpp
 * @brief Unit tests for BitPackedIntegerReader.
 */

#include <catch2/catch.hpp>
#include <colpack/bit_packed_reader.hpp>
#include <colpack/bit_packed_writer.hpp>
#include <colpack/byte_source.hpp>

#include <vector>

using namespace colpack;

namespace {

std::vector<std::uint32_t> make_values(std::size_t count, std::uint32_t max_value) {
    std::vector<std::uint32_t> values(count);
    const std::uint64_t range = static_cast<std::uint64_t>(max_value) + 1U;
    for (std::size_t i = 0; i < count; ++i) {
        values[i] = static_cast<std::uint32_t>((i * 2654435761ULL + i / 3) % range);
    }
    if (count > 0) {
        values[count - 1] = max_value;
    }
    return values;
}

std::vector<std::uint8_t> encode(const std::vector<std::uint32_t>& values,
                                 std::uint32_t max_value, Packer order) {
    BitPackedIntegerWriter writer(max_value, packer_factory(order));
    for (auto v : values) {
        REQUIRE(writer.write_integer(v) == Error::Ok);
    }
    std::vector<std::uint8_t> page;
    REQUIRE(writer.get_bytes().to_byte_array(page) == Error::Ok);
    return page;
}

} // namespace

TEST_CASE("Reader construction", "[reader]") {
    SECTION("width from maximum value") {
        BitPackedIntegerReader reader(7, packer_factory(Packer::LittleEndian));
        REQUIRE(reader.valid());
        REQUIRE(reader.bit_width() == 3);
    }

    SECTION("maximum zero gives width zero") {
        BitPackedIntegerReader reader(0, packer_factory(Packer::LittleEndian));
        REQUIRE(reader.bit_width() == 0);
    }

    SECTION("full 32-bit range") {
        BitPackedIntegerReader reader(0xFFFFFFFFLL, packer_factory(Packer::BigEndian));
        REQUIRE(reader.bit_width() == 32);
    }
}

TEST_CASE("Reader decodes a hand-packed section", "[reader]") {
    // Values 0..7 at width 3, little-endian order
    const std::uint8_t page[] = {0x88, 0xC6, 0xFA};
    BitPackedIntegerReader reader(7, packer_factory(Packer::LittleEndian));
    REQUIRE(reader.init_from_page(8, page, sizeof(page), 0) == Error::Ok);
    REQUIRE(reader.next_offset() == 3);

    for (std::uint32_t i = 0; i < 8; ++i) {
        REQUIRE(reader.read_integer() == i);
    }
}

TEST_CASE("Reader round-trip", "[reader]") {
    auto order = GENERATE(Packer::LittleEndian, Packer::BigEndian);
    std::uint32_t max_value = GENERATE(0U, 1U, 3U, 255U, 65535U);
    std::size_t count = GENERATE(0U, 1U, 7U, 8U, 9U, 63U, 64U, 65U);

    auto values = make_values(count, max_value);
    auto page = encode(values, max_value, order);

    BitPackedIntegerReader reader(max_value, packer_factory(order));
    REQUIRE(reader.init_from_page(count, page.data(), page.size(), 0) == Error::Ok);
    REQUIRE(reader.next_offset() == page.size());

    INFO("max " << max_value << " count " << count);
    for (std::size_t i = 0; i < count; ++i) {
        REQUIRE(reader.read_integer() == values[i]);
    }
    REQUIRE(reader.values_read() == count);
}

TEST_CASE("Reader with width zero", "[reader]") {
    std::size_t count = GENERATE(0U, 1U, 9U, 100U);
    BitPackedIntegerReader reader(0, packer_factory(Packer::LittleEndian));

    SECTION("no backing buffer at all") {
        REQUIRE(reader.init_from_page(count, nullptr, 0, 0) == Error::Ok);
        REQUIRE(reader.next_offset() == 0);
        for (std::size_t i = 0; i < count; ++i) {
            REQUIRE(reader.read_integer() == 0);
        }
    }

    SECTION("page bytes are ignored") {
        const std::uint8_t page[] = {0xFF, 0xFF};
        REQUIRE(reader.init_from_page(count, page, sizeof(page), 1) == Error::Ok);
        REQUIRE(reader.next_offset() == 1);
        for (std::size_t i = 0; i < count; ++i) {
            REQUIRE(reader.read_integer() == 0);
        }
    }
}

TEST_CASE("Reader trailing padding", "[reader]") {
    // 9 values at width 3: 27 bits in 4 bytes; the second batch has only
    // one real byte of its three.
    const std::uint8_t page[] = {0x88, 0xC6, 0xFA, 0x05};
    BitPackedIntegerReader reader(7, packer_factory(Packer::LittleEndian));
    REQUIRE(reader.init_from_page(9, page, sizeof(page), 0) == Error::Ok);
    REQUIRE(reader.next_offset() == 4);

    for (std::uint32_t i = 0; i < 8; ++i) {
        REQUIRE(reader.read_integer() == i);
    }
    REQUIRE(reader.read_integer() == 5);
}

TEST_CASE("Reader section chaining", "[reader]") {
    const auto order = Packer::LittleEndian;
    auto first = make_values(9, 3);
    auto second = make_values(5, 255);

    BitPackedIntegerWriter first_writer(3, packer_factory(order));
    BitPackedIntegerWriter second_writer(255, packer_factory(order));
    for (auto v : first) {
        REQUIRE(first_writer.write_integer(v) == Error::Ok);
    }
    for (auto v : second) {
        REQUIRE(second_writer.write_integer(v) == Error::Ok);
    }

    std::vector<std::uint8_t> page;
    auto source = ByteSource::concat(
        {ByteSource::from_int(0xCAFEF00DU), first_writer.get_bytes(), second_writer.get_bytes()});
    REQUIRE(source.to_byte_array(page) == Error::Ok);
    REQUIRE(page.size() == 4 + 3 + 5);

    BitPackedIntegerReader first_reader(3, packer_factory(order));
    REQUIRE(first_reader.init_from_page(first.size(), page.data(), page.size(), 4) == Error::Ok);
    for (auto expected : first) {
        REQUIRE(first_reader.read_integer() == expected);
    }

    BitPackedIntegerReader second_reader(255, packer_factory(order));
    REQUIRE(second_reader.init_from_page(second.size(), page.data(), page.size(),
                                         first_reader.next_offset()) == Error::Ok);
    REQUIRE(first_reader.next_offset() == 7);
    for (auto expected : second) {
        REQUIRE(second_reader.read_integer() == expected);
    }
    REQUIRE(second_reader.next_offset() == page.size());
}

TEST_CASE("Reader skip", "[reader]") {
    const std::uint8_t page[] = {0x88, 0xC6, 0xFA, 0x05};
    BitPackedIntegerReader reader(7, packer_factory(Packer::LittleEndian));
    REQUIRE(reader.init_from_page(9, page, sizeof(page), 0) == Error::Ok);

    reader.skip();
    reader.skip();
    REQUIRE(reader.read_integer() == 2);
    for (int i = 0; i < 5; ++i) {
        reader.skip();
    }
    REQUIRE(reader.read_integer() == 5);
    REQUIRE(reader.values_read() == 9);
}

TEST_CASE("Reader checked reads", "[reader]") {
    const std::uint8_t page[] = {0x88, 0xC6, 0xFA};
    BitPackedIntegerReader reader(7, packer_factory(Packer::LittleEndian));
    REQUIRE(reader.init_from_page(3, page, sizeof(page), 0) == Error::Ok);

    std::uint32_t value = 99;
    for (std::uint32_t i = 0; i < 3; ++i) {
        REQUIRE(reader.read_integer(value) == Error::Ok);
        REQUIRE(value == i);
    }
    REQUIRE(reader.read_integer(value) == Error::Underflow);
    REQUIRE(value == 2);
    REQUIRE(reader.values_read() == 3);
}

TEST_CASE("Reader re-initialization", "[reader]") {
    const std::uint8_t page[] = {0x88, 0xC6, 0xFA};
    BitPackedIntegerReader reader(7, packer_factory(Packer::LittleEndian));

    REQUIRE(reader.init_from_page(8, page, sizeof(page), 0) == Error::Ok);
    REQUIRE(reader.read_integer() == 0);
    REQUIRE(reader.read_integer() == 1);

    REQUIRE(reader.init_from_page(8, page, sizeof(page), 0) == Error::Ok);
    REQUIRE(reader.values_read() == 0);
    REQUIRE(reader.read_integer() == 0);
}
