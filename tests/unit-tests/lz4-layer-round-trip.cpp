#include "lz4.layer.hh"
#include "test.decoders.hh"
#include "test.layers.hh"
#include "unit.test.macros.hh"

#include <random>
#include <string>

using backup::test::as_bytes;

int
main()
{
    int retval = 1;

    try {
        // more than one 64 KiB block, part of it incompressible
        std::string expected(200000, 'x');
        std::mt19937 rng(7);
        for (size_t i = 0; i < 70000; ++i) {
            expected[i] = static_cast<char>(rng() & 0xff);
        }

        backup::test::MemorySink sink;
        {
            backup::Lz4Layer lz4(sink, 0);

            const size_t split = 12345;
            CHECK(lz4.write(as_bytes(expected.substr(0, split))));
            CHECK(lz4.flush());
            const size_t nbytes_after_flush = sink.bytes.size();
            CHECK(nbytes_after_flush > 0);

            CHECK(lz4.write(as_bytes(expected.substr(split))));
            CHECK(lz4.close());
            CHECK(sink.bytes.size() > nbytes_after_flush);
            CHECK(!lz4.flush());
        }

        CHECK(!sink.closed);
        CHECK(backup::test::lz4_decompress(sink.bytes) == expected);

        // high compression levels use LZ4 HC and decode the same way
        backup::test::MemorySink hc_sink;
        {
            backup::Lz4Layer lz4(hc_sink, 12);
            CHECK(lz4.write(as_bytes(expected)));
            CHECK(lz4.close());
        }
        CHECK(backup::test::lz4_decompress(hc_sink.bytes) == expected);

        // closing an untouched layer yields a valid empty frame
        backup::test::MemorySink empty_sink;
        {
            backup::Lz4Layer lz4(empty_sink, 0);
            CHECK(lz4.close());
        }
        CHECK(!empty_sink.bytes.empty());
        CHECK(backup::test::lz4_decompress(empty_sink.bytes).empty());

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
