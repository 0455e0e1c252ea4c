/**
 * @file test_edge_cases.cpp
 * @brief Error handling and boundary tests across the library.
 */

#include <catch2/catch.hpp>
#include <colpack/colpack.hpp>

#include <cstring>
#include <string>
#include <vector>

using namespace colpack;

// ============================================================================
// Construction errors
// ============================================================================

TEST_CASE("Out-of-range maximum values", "[edge][errors]") {
    const auto& factory = packer_factory(Packer::LittleEndian);

    SECTION("negative maximum") {
        REQUIRE_THROWS_AS(BitPackedIntegerReader(-1, factory), InvalidArgumentException);
        REQUIRE_THROWS_AS(BitPackedIntegerWriter(-1, factory), InvalidArgumentException);
    }

    SECTION("maximum wider than 32 bits") {
        REQUIRE_THROWS_AS(BitPackedIntegerReader(0x100000000LL, factory),
                          InvalidArgumentException);
        REQUIRE_THROWS_AS(BitPackedIntegerWriter(0x100000000LL, factory),
                          InvalidArgumentException);
    }

    SECTION("exception carries the error code") {
        try {
            BitPackedIntegerReader reader(-5, factory);
            FAIL("expected an exception");
        } catch (const ColpackException& e) {
            REQUIRE(e.code() == Error::InvalidArg);
        }
    }
}

// ============================================================================
// Reader boundaries
// ============================================================================

TEST_CASE("Reader init_from_page errors", "[edge][reader]") {
    BitPackedIntegerReader reader(15, packer_factory(Packer::LittleEndian));
    const std::uint8_t page[4] = {0};

    SECTION("offset past the page") {
        REQUIRE(reader.init_from_page(1, page, sizeof(page), 5) == Error::InvalidArg);
    }

    SECTION("offset at the end of the page is allowed") {
        REQUIRE(reader.init_from_page(0, page, sizeof(page), 4) == Error::Ok);
        REQUIRE(reader.next_offset() == 4);
    }

    SECTION("missing page for a non-empty section") {
        REQUIRE(reader.init_from_page(3, nullptr, 0, 0) == Error::InvalidArg);
    }
}

TEST_CASE("Reader past the end of the page", "[edge][reader]") {
    // One value of width 8 in a one-byte page; reads past it decode
    // zero padding instead of touching memory beyond the page.
    const std::uint8_t page[] = {0xAB};
    BitPackedIntegerReader reader(255, packer_factory(Packer::LittleEndian));
    REQUIRE(reader.init_from_page(1, page, sizeof(page), 0) == Error::Ok);

    REQUIRE(reader.read_integer() == 0xAB);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(reader.read_integer() == 0);
    }
}

TEST_CASE("Reader section ending exactly at the page end", "[edge][reader]") {
    // 16 values of width 4 fill 8 bytes; both batches decode in place.
    std::vector<std::uint8_t> page(8);
    for (std::size_t i = 0; i < page.size(); ++i) {
        page[i] = static_cast<std::uint8_t>((i << 4) | i);
    }

    BitPackedIntegerReader reader(15, packer_factory(Packer::LittleEndian));
    REQUIRE(reader.init_from_page(16, page.data(), page.size(), 0) == Error::Ok);
    for (std::uint32_t i = 0; i < 16; ++i) {
        REQUIRE(reader.read_integer() == i / 2);
    }
    REQUIRE(reader.next_offset() == page.size());
}

TEST_CASE("Reader at width 32", "[edge][reader]") {
    std::vector<std::uint8_t> page(4 * 3);
    write_int_little_endian(page.data(), 0xFFFFFFFFU);
    write_int_little_endian(page.data() + 4, 0);
    write_int_little_endian(page.data() + 8, 0x12345678U);

    BitPackedIntegerReader reader(0xFFFFFFFFLL, packer_factory(Packer::LittleEndian));
    REQUIRE(reader.init_from_page(3, page.data(), page.size(), 0) == Error::Ok);
    REQUIRE(reader.next_offset() == 12);
    REQUIRE(reader.read_integer() == 0xFFFFFFFFU);
    REQUIRE(reader.read_integer() == 0);
    REQUIRE(reader.read_integer() == 0x12345678U);
}

// ============================================================================
// Error reporting
// ============================================================================

TEST_CASE("error_string", "[edge][errors]") {
    REQUIRE(std::string(error_string(Error::Ok)) == "Success");
    REQUIRE(std::string(error_string(Error::Underflow)) == "Buffer underflow");
    REQUIRE(std::string(error_string(Error::Unsupported)) == "Unsupported operation");
    REQUIRE(std::string(error_string(Error::Io)) == "I/O error");
}

TEST_CASE("throw_if_error", "[edge][errors]") {
    REQUIRE_NOTHROW(throw_if_error(Error::Ok, "ok"));
    REQUIRE_THROWS_AS(throw_if_error(Error::InvalidArg, "ctx"), InvalidArgumentException);
    REQUIRE_THROWS_AS(throw_if_error(Error::Underflow, "ctx"), UnderflowException);
    REQUIRE_THROWS_AS(throw_if_error(Error::Unsupported, "ctx"), UnsupportedOperationException);
    REQUIRE_THROWS_AS(throw_if_error(Error::Io, "ctx"), ColpackException);

    SECTION("message names the context") {
        try {
            throw_if_error(Error::Overflow, "write page");
            FAIL("expected an exception");
        } catch (const ColpackException& e) {
            REQUIRE(e.code() == Error::Overflow);
            REQUIRE(std::strstr(e.what(), "write page") != nullptr);
        }
    }
}

TEST_CASE("Empty source write_to surfaces as an exception", "[edge][errors]") {
    std::uint8_t buffer[4] = {0};
    auto result = ByteSource::empty().write_to(buffer, sizeof(buffer), 0, 1);
    REQUIRE_THROWS_AS(throw_if_error(result, "write"), UnsupportedOperationException);
}

// ============================================================================
// Sink failures propagate
// ============================================================================

namespace {

class FailingSink final : public ByteSink {
public:
    explicit FailingSink(std::size_t budget) : budget_(budget) {}

    Error write(const std::uint8_t*, std::size_t size) override {
        ++calls;
        if (size > budget_) {
            return Error::Io;
        }
        budget_ -= size;
        return Error::Ok;
    }

    int calls = 0;

private:
    std::size_t budget_;
};

} // namespace

TEST_CASE("Concatenation stops at the first sink error", "[edge][byte_source]") {
    const std::uint8_t data[] = {1, 2, 3, 4};
    auto source = ByteSource::concat({ByteSource::from(data, 2), ByteSource::from(data, 4),
                                      ByteSource::from(data, 1)});

    FailingSink sink(3);
    REQUIRE(source.write_all_to(sink) == Error::Io);
    REQUIRE(sink.calls == 2);
}

TEST_CASE("Concatenation over a buffer that shrank", "[edge][byte_source]") {
    GrowableBuffer buffer(4);
    const std::uint8_t data[] = {1, 2, 3, 4, 5, 6};
    REQUIRE(buffer.write(data, sizeof(data)) == Error::Ok);

    auto source = ByteSource::concat({ByteSource::from(buffer)});
    buffer.reset();

    std::uint8_t target[6] = {0};
    REQUIRE(source.write_to(target, sizeof(target), 0, 6) == Error::Underflow);
}

TEST_CASE("Library version", "[edge]") {
    REQUIRE(std::string(version()) == "1.0.0");
    REQUIRE(VERSION_MAJOR == 1);
}
