#include "writer.layer.hh"
#include "macros.hh"

const char*
backup::layer_kind_name(LayerKind kind)
{
    switch (kind) {
        case LayerKind::Sink:
            return "sink";
        case LayerKind::Codec:
            return "codec";
        case LayerKind::Cipher:
            return "cipher";
    }
    return "unknown";
}

backup::CodecLayer::CodecLayer(WriterLayer& next)
  : next_{ next }
  , closed_{ false }
{
}

bool
backup::CodecLayer::abort(std::string_view reason)
{
    // nothing below this layer may see a partial trailer
    LOG_DEBUG("Abandoning ", name(), " stream: ", reason);
    closed_ = true;
    return true;
}

bool
backup::CodecLayer::write_next_(std::span<const std::byte> data)
{
    if (data.empty()) {
        return true;
    }

    if (!next_.write(data)) {
        next_.mark_failed();
        LOG_ERROR("Failed to write ",
                  data.size(),
                  " encoded bytes from ",
                  name(),
                  " to ",
                  next_.name());
        return false;
    }

    return true;
}
