/**
 * @file bench.cpp
 * @brief Performance benchmarks for colpack bit-packed sections.
 *
 * Measures decode throughput of BitPackedIntegerReader and the cost of
 * materializing concatenated page sources, for regression testing during
 * development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/colpack_bench              # Run with default 100 iterations
 *   ./build/colpack_bench 1000         # Run with custom iteration count
 */

#include <colpack/colpack.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <utility>
#include <vector>

using namespace colpack;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t VALUE_COUNT = 1U << 16;

static std::vector<std::uint32_t> make_values(std::uint32_t max_value) {
    std::vector<std::uint32_t> values(VALUE_COUNT);
    std::uint64_t state = 0x9E3779B97F4A7C15ULL;
    const std::uint64_t range = static_cast<std::uint64_t>(max_value) + 1U;
    for (auto& v : values) {
        state = state * 6364136223846793005ULL + 1442695040888963407ULL;
        v = static_cast<std::uint32_t>((state >> 32) % range);
    }
    return values;
}

static std::vector<std::uint8_t> encode(const std::vector<std::uint32_t>& values,
                                        std::uint32_t max_value, Packer order) {
    BitPackedIntegerWriter writer(max_value, packer_factory(order));
    for (auto v : values) {
        throw_if_error(writer.write_integer(v), "write_integer");
    }

    std::vector<std::uint8_t> page;
    throw_if_error(writer.get_bytes().to_byte_array(page), "get_bytes");
    return page;
}

static void bench_decode(const char* name, std::uint32_t max_value, Packer order,
                         int iterations) {
    auto values = make_values(max_value);
    auto page = encode(values, max_value, order);

    BitPackedIntegerReader reader(max_value, packer_factory(order));
    std::uint64_t checksum = 0;

    // Warmup run
    throw_if_error(reader.init_from_page(values.size(), page.data(), page.size(), 0), "init");
    for (std::size_t i = 0; i < values.size(); i++) {
        checksum += reader.read_integer();
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        throw_if_error(reader.init_from_page(values.size(), page.data(), page.size(), 0), "init");
        for (std::size_t j = 0; j < values.size(); j++) {
            checksum += reader.read_integer();
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_value_ns = per_iter_us * 1000.0 / static_cast<double>(values.size());
    double throughput_mbps = static_cast<double>(page.size()) / per_iter_us;

    std::printf("%-20s %8.2f µs/iter  %6.2f ns/val  %8.1f MB/s  (%zu bytes, %llx)\n", name,
                per_iter_us, per_value_ns, throughput_mbps, page.size(),
                static_cast<unsigned long long>(checksum & 0xFFFF));
}

static void bench_concat(const char* name, std::size_t sections, int iterations) {
    auto values = make_values(4095);
    auto section = encode(values, 4095, Packer::LittleEndian);

    std::vector<ByteSource> parts;
    for (std::size_t i = 0; i < sections; i++) {
        parts.push_back(ByteSource::from_int(static_cast<std::uint32_t>(section.size())));
        parts.push_back(ByteSource::from_vector(section));
    }
    auto source = ByteSource::concat(std::move(parts));

    std::vector<std::uint8_t> page;
    std::vector<std::uint8_t> buffer(source.size());

    // Warmup run
    throw_if_error(source.to_byte_array(page), "to_byte_array");

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        throw_if_error(source.to_byte_array(page), "to_byte_array");
        throw_if_error(source.write_to(buffer.data(), buffer.size(), 0, buffer.size()),
                       "write_to");
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = 2.0 * static_cast<double>(source.size()) / per_iter_us;

    std::printf("%-20s %8.2f µs/iter  %8.1f MB/s  (%zu bytes)\n", name, per_iter_us,
                throughput_mbps, source.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("colpack Benchmarks\n");
    std::printf("==================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Values per section: %zu\n\n", VALUE_COUNT);

    try {
        std::printf("Decode:\n");
        bench_decode("width 1 LE", 1, Packer::LittleEndian, iterations);
        bench_decode("width 3 LE", 7, Packer::LittleEndian, iterations);
        bench_decode("width 12 LE", 4095, Packer::LittleEndian, iterations);
        bench_decode("width 12 BE", 4095, Packer::BigEndian, iterations);
        bench_decode("width 20 LE", (1U << 20) - 1, Packer::LittleEndian, iterations);
        bench_decode("width 32 LE", 0xFFFFFFFFU, Packer::LittleEndian, iterations);

        std::printf("\nPage assembly:\n");
        bench_concat("1 section", 1, iterations);
        bench_concat("16 sections", 16, iterations);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    std::printf("\nUse these results for relative comparisons only.\n");

    return 0;
}
