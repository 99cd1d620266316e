#include "layer.stack.hh"
#include "backup.errors.hh"
#include "test.layers.hh"
#include "unit.test.macros.hh"

#include <memory>
#include <string>
#include <vector>

using backup::test::as_bytes;

int
main()
{
    int retval = 1;

    try {
        auto log = std::make_shared<backup::test::CallLog>();

        auto sink = std::make_unique<backup::test::MemorySink>(log, "sink");
        auto* sink_ptr = sink.get();

        backup::LayerStack stack(std::move(sink));
        stack.push(std::make_unique<backup::test::RecordingLayer>(
          stack.top(), log, "codec"));
        stack.push(std::make_unique<backup::test::RecordingLayer>(
          stack.top(), log, "cipher", backup::LayerKind::Cipher));
        EXPECT_EQ(size_t, stack.size(), 3);

        // writes enter at the outermost layer
        EXPECT_EQ(size_t, stack.write(as_bytes("payload")), 7);
        EXPECT_STR_EQ(backup::test::to_string(sink_ptr->bytes).c_str(),
                      "payload");

        log->clear();
        stack.close();
        CHECK(stack.state() == backup::LayerStack::State::Closed);

        const std::vector<std::string> expected = {
            "cipher.flush", "cipher.close", "codec.flush", "codec.close",
            "sink.flush",   "sink.close",   "sink.await",
        };
        EXPECT_EQ(size_t, log->size(), expected.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            EXPECT_STR_EQ((*log)[i].c_str(), expected[i].c_str());
        }

        // a second close has nothing left to do
        log->clear();
        stack.close();
        CHECK(log->empty());

        EXPECT_THROWS(backup::WriterClosedError, stack.write(as_bytes("x")));
        CHECK(log->empty());

        // a stack without a sink can't be built
        EXPECT_THROWS(backup::ConstructionError, backup::LayerStack(nullptr));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
