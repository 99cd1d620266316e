#pragma once

#include "writer.layer.hh"

#include <cstddef> // size_t, std::byte
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace backup {
/**
 * @brief The ordered stack of layers a backup is written through.
 * @details Index 0 is the sink. Each layer pushed wraps the one below it, and
 * application bytes go to the outermost (last) layer. Layers are torn down in
 * reverse order of construction.
 */
class LayerStack final
{
  public:
    enum class State
    {
        Writable,
        Closing,
        Closed
    };

    /**
     * @param sink The innermost layer.
     * @throws ConstructionError if @p sink is null, leaving the stack empty.
     */
    explicit LayerStack(std::unique_ptr<Sink> sink);

    /// @brief Closes the stack if it has not been closed, logging any error.
    ~LayerStack() noexcept;

    LayerStack(const LayerStack&) = delete;
    LayerStack& operator=(const LayerStack&) = delete;

    /**
     * @brief Push a layer wrapping the current outermost layer.
     * @throws std::runtime_error if @p layer is null or the stack is closed.
     */
    void push(std::unique_ptr<WriterLayer> layer);

    /** @brief The outermost layer. */
    WriterLayer& top();

    size_t size() const noexcept { return layers_.size(); }
    State state() const noexcept { return state_; }

    /**
     * @brief Write data to the outermost layer.
     * @param data The bytes to write.
     * @return The number of bytes written, always data.size().
     * @throws WriterClosedError if the stack is not writable.
     * @throws IOError tagged with the innermost layer that failed. The stack
     * is abandoned and a later close() rethrows the same error. If the sink's
     * background work failed too, its error is part of the message.
     */
    size_t write(std::span<const std::byte> data);

    /**
     * @brief Flush and close each layer, outermost first, then wait for the
     * sink's background work.
     * @details The first failure stops the walk and abandons the layers below.
     * Calling close() again replays the outcome of the first call.
     * @throws IOError if a layer fails to flush or close, tagged with the
     * innermost layer that failed. A failed upload is part of the message.
     * @throws UploadError if the sink's background upload failed.
     */
    void close();

    /**
     * @brief Abandon every layer still open, outermost first, and wait for the
     * sink's background work.
     * @param reason Why the stack is being abandoned.
     * @return A description of any failures, or an empty string.
     */
    std::string abort(std::string_view reason) noexcept;

  private:
    std::vector<std::unique_ptr<WriterLayer>> layers_;
    Sink* sink_;
    size_t nlayers_open_; // layers [0, nlayers_open_) are open
    State state_;
    std::exception_ptr close_error_;

    void close_layers_();

    /**
     * @brief Abandon the open layers after a failure and wait for the sink.
     * @return The error of the sink's background work, unless it failed only
     * because it was abandoned. Empty otherwise.
     */
    std::string abandon_(const std::string& err) noexcept;

    /// @brief The lowest index in [0, index] whose layer has failed.
    size_t failed_index_(size_t index) const noexcept;

    /// @brief Abandon the open layers, returning a description of failures.
    std::string abort_layers_(std::string_view reason) noexcept;

    std::string layer_label_(size_t index) const;
};
} // namespace backup
