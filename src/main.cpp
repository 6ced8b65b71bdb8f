#include <iostream>
#include <vector>
#include <string>
#include <random>
#include <iomanip>
#include <stdexcept>

#include "epb.hpp"
#include "bitstream.hpp"
#include "fileio.hpp"

static void printUsage() {
    std::cerr << "usage:\n"
              << "  epbtool encode  <in> <out>    escape a raw RBSP file\n"
              << "  epbtool decode  <in> <out>    strip emulation prevention bytes\n"
              << "  epbtool compare <a> <b> ...   exit 0 if all files are identical\n"
              << "  epbtool selftest              run the round-trip self-test\n";
}

// Generate N bytes biased towards 0x00 so that start-code-like runs
// show up often.
static std::vector<uint8_t> generateSource(int N, unsigned seed) {
    std::mt19937 rng(seed);
    std::discrete_distribution<int> zeroOrNot({60, 40});
    std::uniform_int_distribution<int> byteDist(1, 255);

    std::vector<uint8_t> data;
    data.reserve(N);
    for (int i = 0; i < N; ++i) {
        data.push_back(zeroOrNot(rng) == 0 ? 0 : static_cast<uint8_t>(byteDist(rng)));
    }
    return data;
}

static bool hasStartCodePrefix(const std::vector<uint8_t>& data) {
    for (size_t i = 0; i + 2 < data.size(); ++i) {
        if (data[i] == 0 && data[i + 1] == 0 && data[i + 2] <= 0x02) {
            return true;
        }
    }
    return false;
}

// Round-trips random payloads and a small RBSP written with BitWriter.
static bool selfTest() {
    std::cout << "=== Emulation prevention self-test ===\n";
    bool allOk = true;

    {
        std::vector<uint8_t> data = {0x00, 0x00, 0x01};
        auto coded   = epbEncode(data);
        auto decoded = epbDecode(coded);
        bool ok = (coded == std::vector<uint8_t>{0x00, 0x00, 0x03, 0x01}) && decoded == data;
        std::cout << "  Single escape roundtrip:       " << std::boolalpha << ok << "\n";
        allOk = allOk && ok;
    }

    {
        std::vector<uint8_t> data = generateSource(4096, 12345);
        auto coded   = epbEncode(data);
        auto decoded = epbDecode(coded);
        bool ok = (decoded == data) && !hasStartCodePrefix(coded);
        std::cout << "  Random 4096-byte roundtrip:    " << std::boolalpha << ok << "\n";
        std::cout << "  Escape bytes inserted: " << epbCount(data) << "\n";
        allOk = allOk && ok;
    }

    {
        BitWriter bw;
        bw.writeBits(0, 16);
        bw.writeBits(0x1, 8);
        bw.writeBits(0x2A, 6);
        bw.writeTrailingBits();
        std::vector<uint8_t> rbsp = bw.flush();

        auto decoded = epbDecode(epbEncode(rbsp));
        BitReader br(decoded);
        bool ok = br.readBits(16) == 0 && br.readBits(8) == 0x1 && br.readBits(6) == 0x2A
               && !br.moreRbspData();
        std::cout << "  RBSP fields after roundtrip:   " << std::boolalpha << ok << "\n";
        allOk = allOk && ok;
    }

    std::cout << "======================================\n";
    return allOk;
}

static void report(const std::string& what, const std::vector<uint8_t>& in,
                   const std::vector<uint8_t>& out) {
    std::cout << what << ":\n";
    std::cout << "  input bytes  = " << in.size() << "\n";
    std::cout << "  output bytes = " << out.size() << "\n";
    if (!in.empty()) {
        double ratio = static_cast<double>(out.size()) / static_cast<double>(in.size());
        std::cout << std::fixed << std::setprecision(6)
                  << "  size ratio   = " << ratio << "\n";
    }
}

static int run(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    if (cmd == "selftest" && args.size() == 1) {
        return selfTest() ? 0 : 1;
    }

    if ((cmd == "encode" || cmd == "decode") && args.size() == 3) {
        std::vector<uint8_t> in = readFile(args[1]);
        std::vector<uint8_t> out = (cmd == "encode") ? epbEncode(in) : epbDecode(in);
        writeFile(args[2], out);
        report(cmd, in, out);
        return 0;
    }

    if (cmd == "compare" && args.size() >= 3) {
        bool same = isSameFile(std::vector<std::string>(args.begin() + 1, args.end()));
        std::cout << "identical = " << std::boolalpha << same << "\n";
        return same ? 0 : 1;
    }

    printUsage();
    return 2;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 2;
    }

    try {
        return run(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
