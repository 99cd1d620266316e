#pragma once

#include <cstddef> // std::byte
#include <span>
#include <string_view>

namespace backup {
enum class LayerKind
{
    Sink,
    Codec,
    Cipher
};

const char*
layer_kind_name(LayerKind kind);

/**
 * @brief One stage of the write/flush/close stack.
 * @details Failures are reported by returning false and logging the reason.
 * Once closed, a layer rejects further writes.
 */
class WriterLayer
{
  public:
    virtual ~WriterLayer() = default;

    virtual LayerKind kind() const noexcept = 0;

    /** @brief Short name of the layer, e.g., "file" or "gzip". */
    virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Write data to the layer.
     * @param data The bytes to write.
     * @return True if all of @p data was accepted, false otherwise.
     */
    [[nodiscard]] virtual bool write(std::span<const std::byte> data) = 0;

    /**
     * @brief Push any buffered data to the next layer.
     * @return True on success. Layers that do not buffer succeed trivially.
     */
    [[nodiscard]] virtual bool flush() { return true; }

    /**
     * @brief Finish the layer's output and release its resources.
     * @note Closing a layer never closes the layer it wraps.
     * @return True on success, false otherwise.
     */
    [[nodiscard]] virtual bool close() = 0;

    /**
     * @brief Close the layer without completing its output.
     * @param reason Why the layer is being abandoned.
     * @return True on success, false otherwise.
     */
    [[nodiscard]] virtual bool abort(std::string_view reason)
    {
        return close();
    }

    /**
     * @brief Record that a call on this layer returned false.
     * @details Set by whoever made the call, so that a failure reported
     * through the layers above can be traced to the layer it started in.
     */
    void mark_failed() noexcept { failed_ = true; }
    bool failed() const noexcept { return failed_; }

  private:
    bool failed_ = false;
};

/**
 * @brief The innermost layer, which persists bytes.
 */
class Sink : public WriterLayer
{
  public:
    LayerKind kind() const noexcept override { return LayerKind::Sink; }

    /**
     * @brief Wait for any work the sink does in the background.
     * @details Called once, after the sink has been closed or aborted.
     * @throws UploadError if the background work failed.
     */
    virtual void await_completion() {}
};

/**
 * @brief A layer that encodes bytes before passing them to the layer it wraps.
 */
class CodecLayer : public WriterLayer
{
  public:
    explicit CodecLayer(WriterLayer& next);

    LayerKind kind() const noexcept override { return LayerKind::Codec; }

    bool abort(std::string_view reason) override;

  protected:
    WriterLayer& next_;
    bool closed_;

    /// @brief Forward encoded bytes to the wrapped layer.
    [[nodiscard]] bool write_next_(std::span<const std::byte> data);
};
} // namespace backup
