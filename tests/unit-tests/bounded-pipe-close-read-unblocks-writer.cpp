#include "bounded.pipe.hh"
#include "unit.test.macros.hh"

#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

int
main()
{
    int retval = 1;

    try {
        // a reader that gives up must not leave the writer blocked forever
        {
            backup::BoundedPipe pipe(8);
            std::vector<std::byte> data(32);

            bool write_ok = true;
            std::thread writer([&] { write_ok = pipe.write(data); });

            std::this_thread::sleep_for(20ms);
            pipe.close_read("connection reset");
            writer.join();

            CHECK(!write_ok);
            EXPECT_STR_EQ(pipe.error().c_str(), "connection reset");
        }

        // a writer that aborts ends the stream for the reader, discarding
        // whatever is still buffered
        {
            backup::BoundedPipe pipe(8);
            std::vector<std::byte> data(4);
            CHECK(pipe.write(data));
            pipe.close_write("aborted");

            std::vector<std::byte> buf(8);
            EXPECT_EQ(size_t, pipe.read(buf), 0);
            EXPECT_STR_EQ(pipe.error().c_str(), "aborted");
            CHECK(!pipe.write(data));
        }

        // a clean close still delivers buffered bytes
        {
            backup::BoundedPipe pipe(8);
            std::vector<std::byte> data(4);
            CHECK(pipe.write(data));
            pipe.close_write();

            std::vector<std::byte> buf(8);
            EXPECT_EQ(size_t, pipe.read(buf), 4);
            EXPECT_EQ(size_t, pipe.read(buf), 0);
            CHECK(pipe.error().empty());
        }

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
