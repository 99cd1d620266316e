#include "layer.stack.hh"
#include "backup.errors.hh"
#include "macros.hh"

backup::LayerStack::LayerStack(std::unique_ptr<Sink> sink)
  : sink_{ sink.get() }
  , nlayers_open_{ 0 }
  , state_{ State::Writable }
{
    if (!sink) {
        const std::string err = LOG_ERROR("There are no backup writers");
        throw ConstructionError(err);
    }

    layers_.push_back(std::move(sink));
    nlayers_open_ = layers_.size();
}

backup::LayerStack::~LayerStack() noexcept
{
    if (state_ == State::Writable) {
        try {
            close();
        } catch (const std::exception& exc) {
            LOG_ERROR("Error closing backup writer: ", exc.what());
        }
    }

    // outermost layers reference the ones below them
    while (!layers_.empty()) {
        layers_.pop_back();
    }
}

void
backup::LayerStack::push(std::unique_ptr<WriterLayer> layer)
{
    EXPECT(layer, "Null pointer: layer");
    EXPECT(state_ == State::Writable, "Cannot add a layer to a closed stack");

    LOG_DEBUG("Adding ",
              layer_kind_name(layer->kind()),
              " layer ",
              layer->name(),
              " at index ",
              layers_.size());

    layers_.push_back(std::move(layer));
    nlayers_open_ = layers_.size();
}

backup::WriterLayer&
backup::LayerStack::top()
{
    return *layers_.back();
}

size_t
backup::LayerStack::write(std::span<const std::byte> data)
{
    if (state_ != State::Writable) {
        const std::string err =
          LOG_ERROR("Cannot write to a closed backup writer");
        throw WriterClosedError(err);
    }

    const size_t top = layers_.size() - 1;
    if (!layers_[top]->write(data)) {
        layers_[top]->mark_failed();
        const size_t index = failed_index_(top);

        std::string err = "Error writing " + std::to_string(data.size()) +
                          " bytes to " + layer_label_(top);
        if (index != top) {
            err += ": " + layer_label_(index) + " failed";
        }
        LOG_ERROR(err);

        // a partial write leaves the stream undecodable; never complete it
        state_ = State::Closing;
        if (const auto upload_error = abandon_(err); !upload_error.empty()) {
            err += " (" + upload_error + ")";
        }

        close_error_ = std::make_exception_ptr(IOError(index, err));
        state_ = State::Closed;
        std::rethrow_exception(close_error_);
    }

    return data.size();
}

void
backup::LayerStack::close()
{
    if (state_ == State::Closed) {
        if (close_error_) {
            std::rethrow_exception(close_error_);
        }
        return;
    }
    EXPECT(state_ == State::Writable, "Backup writer is already closing");

    state_ = State::Closing;
    try {
        close_layers_();

        // every layer closed cleanly, but the upload may still have failed
        sink_->await_completion();
    } catch (const std::exception&) {
        close_error_ = std::current_exception();
        state_ = State::Closed;
        throw;
    }

    state_ = State::Closed;
}

std::string
backup::LayerStack::abort(std::string_view reason) noexcept
{
    if (state_ == State::Closed) {
        return {};
    }
    state_ = State::Closing;

    std::string errors = abort_layers_(reason);

    try {
        sink_->await_completion();
    } catch (const std::exception& exc) {
        // the sink reports the abort itself as a failure
        LOG_DEBUG("Abandoned upload finished with: ", exc.what());
    }

    state_ = State::Closed;
    return errors;
}

void
backup::LayerStack::close_layers_()
{
    while (nlayers_open_ > 0) {
        const size_t index = nlayers_open_ - 1;
        auto& layer = *layers_[index];

        const char* action = nullptr;
        if (!layer.flush()) {
            action = "flushing";
        } else if (!layer.close()) {
            action = "closing";
        }

        if (action != nullptr) {
            layer.mark_failed();
            const size_t failed = failed_index_(index);

            std::string err = "Error " + std::string(action) + " " +
                              layer_label_(index);
            if (failed != index) {
                err += ": " + layer_label_(failed) + " failed";
            }
            LOG_ERROR(err);

            if (const auto upload_error = abandon_(err);
                !upload_error.empty()) {
                err += " (" + upload_error + ")";
            }

            throw IOError(failed, err);
        }

        --nlayers_open_;
    }
}

std::string
backup::LayerStack::abandon_(const std::string& err) noexcept
{
    if (auto errors = abort_layers_(err); !errors.empty()) {
        LOG_ERROR("While abandoning the backup: ", errors);
    }

    try {
        sink_->await_completion();
    } catch (const UploadAbortedError& exc) {
        LOG_DEBUG(exc.what());
    } catch (const std::exception& exc) {
        // the upload failed on its own, often the reason the layer failed
        LOG_ERROR("Upload failed: ", exc.what());
        return exc.what();
    }

    return {};
}

size_t
backup::LayerStack::failed_index_(size_t index) const noexcept
{
    for (size_t i = 0; i < index; ++i) {
        if (layers_[i]->failed()) {
            return i;
        }
    }
    return index;
}

std::string
backup::LayerStack::abort_layers_(std::string_view reason) noexcept
{
    std::string errors;
    auto append_error = [&errors](const std::string& msg) {
        if (!errors.empty()) {
            errors += "; ";
        }
        errors += msg;
    };

    while (nlayers_open_ > 0) {
        const size_t index = nlayers_open_ - 1;
        --nlayers_open_;

        try {
            if (!layers_[index]->abort(reason)) {
                append_error("error abandoning " + layer_label_(index));
            }
        } catch (const std::exception& exc) {
            append_error("error abandoning " + layer_label_(index) + ": " +
                         exc.what());
        }
    }

    return errors;
}

std::string
backup::LayerStack::layer_label_(size_t index) const
{
    return "writer layer " + std::to_string(index) + " (" +
           std::string(layers_[index]->name()) + ")";
}
