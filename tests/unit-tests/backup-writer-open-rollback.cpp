#include "backup.writer.hh"
#include "backup.errors.hh"
#include "test.layers.hh"
#include "unit.test.macros.hh"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

int
main()
{
    int retval = 1;

    try {
        auto store = std::make_shared<backup::test::MockObjectStore>();
        auto log = std::make_shared<backup::test::CallLog>();

        const std::vector<backup::LayerFactory> layers{
            [log](backup::WriterLayer& next)
              -> std::unique_ptr<backup::WriterLayer> {
                return std::make_unique<backup::test::RecordingLayer>(
                  next, log, "codec");
            },
            [](backup::WriterLayer&) -> std::unique_ptr<backup::WriterLayer> {
                throw backup::ConstructionError("cipher key rejected");
            },
        };

        std::string what;
        try {
            BackupWriter_s writer(
              "rollback.bak",
              backup::Destination::object_store("backups", store),
              layers);
        } catch (const backup::ConstructionError& exc) {
            what = exc.what();
        }
        CHECK(what.find("rollback.bak") != std::string::npos);
        CHECK(what.find("cipher key rejected") != std::string::npos);

        // the layer opened before the failure is abandoned, never closed
        CHECK(std::find(log->begin(), log->end(), "codec.abort") !=
              log->end());
        CHECK(std::find(log->begin(), log->end(), "codec.close") ==
              log->end());

        // nothing was stored, and the upload thread is gone
        CHECK(!store->put_returned);
        CHECK(!store->completed);
        EXPECT_EQ(int, store->ncalls.load(), 1); // bucket_exists
        std::this_thread::sleep_for(50ms);
        EXPECT_EQ(int, store->ncalls.load(), 1);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
