#include "macros.hh"
#include "backup.writer.hh"
#include "backup.common.hh"
#include "backup.errors.hh"
#include "codec.creator.hh"
#include "s3.connection.hh"
#include "sink.creator.hh"

namespace {
[[noreturn]] void
throw_invalid_settings(const std::string& msg)
{
    const std::string err = LOG_ERROR(msg);
    throw backup::ConfigurationError(err);
}

void
validate_cipher(BackupCipher cipher)
{
    if (cipher != BackupCipher_None) {
        const std::string err =
          LOG_ERROR("Unsupported cipher: ", static_cast<int>(cipher));
        throw backup::UnsupportedCodecError(err);
    }
}

bool
is_blank(const char* s)
{
    return s == nullptr || backup::trim(s).empty();
}

void
validate_s3_settings(const BackupS3Settings* settings)
{
    if (is_blank(settings->endpoint)) {
        throw_invalid_settings("Invalid S3 settings: endpoint is empty");
    }
    if (is_blank(settings->access_key_id)) {
        throw_invalid_settings("Invalid S3 settings: access key ID is empty");
    }
    if (is_blank(settings->secret_access_key)) {
        throw_invalid_settings(
          "Invalid S3 settings: secret access key is empty");
    }

    std::string trimmed =
      backup::trim(settings->bucket_name ? settings->bucket_name : "");
    if (trimmed.length() < 3 || trimmed.length() > 63) {
        throw_invalid_settings("Invalid length for S3 bucket name: " +
                               std::to_string(trimmed.length()) +
                               ". Must be between 3 and 63 characters");
    }
}

void
validate_settings(const struct BackupWriterSettings_s* settings)
{
    if (settings == nullptr) {
        throw_invalid_settings("Null pointer: settings");
    }

    if (is_blank(settings->object_name)) {
        throw_invalid_settings("Object name must not be empty");
    }

    switch (settings->destination) {
        case BackupDestination_Filesystem:
            if (is_blank(settings->directory)) {
                throw_invalid_settings(
                  "Filesystem destinations require a directory");
            }
            break;
        case BackupDestination_ObjectStore:
            if (settings->s3_settings == nullptr) {
                throw_invalid_settings(
                  "Object store destinations require S3 settings");
            }
            validate_s3_settings(settings->s3_settings);
            break;
        default:
            throw_invalid_settings(
              "Don't know how to handle destination kind " +
              std::to_string(static_cast<int>(settings->destination)));
    }
}

/// Validate the encodings and describe their layers, innermost first.
std::vector<backup::LayerFactory>
make_encoding_layers(BackupCodec codec, uint8_t level, BackupCipher cipher)
{
    backup::validate_codec(codec, level);
    validate_cipher(cipher);

    std::vector<backup::LayerFactory> layers;
    if (codec != BackupCodec_None) {
        layers.push_back([codec, level](backup::WriterLayer& next)
                           -> std::unique_ptr<backup::WriterLayer> {
            return backup::make_codec_layer(codec, level, next);
        });
    }

    // BackupCipher_None adds no layer; a cipher would wrap the codec here

    return layers;
}

backup::Destination
make_destination(const struct BackupWriterSettings_s* settings)
{
    if (settings->destination == BackupDestination_Filesystem) {
        return backup::Destination::filesystem(
          backup::trim(settings->directory));
    }

    const auto* s3 = settings->s3_settings;
    auto connection =
      std::make_shared<backup::S3Connection>(backup::trim(s3->endpoint),
                                             backup::trim(s3->access_key_id),
                                             backup::trim(s3->secret_access_key));

    return backup::Destination::object_store(backup::trim(s3->bucket_name),
                                             connection);
}
} // namespace

/* BackupWriter_s implementation */

BackupWriter_s::BackupWriter_s(const struct BackupWriterSettings_s* settings)
{
    validate_settings(settings);

    BackupCodec codec = BackupCodec_None;
    uint8_t level = 0;
    if (settings->compression_settings != nullptr) {
        codec = settings->compression_settings->codec;
        level = settings->compression_settings->level;
    }

    // reject unsupported encodings before connecting to anything
    const auto layers =
      make_encoding_layers(codec, level, settings->cipher);

    backup::Destination destination;
    try {
        destination = make_destination(settings);
    } catch (const backup::BackupError&) {
        throw;
    } catch (const std::exception& exc) {
        const std::string err =
          LOG_ERROR("Cannot create object store session: ", exc.what());
        throw backup::ConstructionError(err);
    }

    open_(settings->object_name,
          destination,
          layers,
          settings->pipe_buffer_bytes);
}

BackupWriter_s::BackupWriter_s(std::string_view object_name,
                               const backup::Destination& destination,
                               BackupCodec codec,
                               uint8_t compression_level,
                               BackupCipher cipher,
                               size_t pipe_buffer_bytes)
{
    open_(object_name,
          destination,
          make_encoding_layers(codec, compression_level, cipher),
          pipe_buffer_bytes);
}

BackupWriter_s::BackupWriter_s(std::string_view object_name,
                               const backup::Destination& destination,
                               const std::vector<backup::LayerFactory>& layers,
                               size_t pipe_buffer_bytes)
{
    open_(object_name, destination, layers, pipe_buffer_bytes);
}

size_t
BackupWriter_s::write(const void* data, size_t nbytes)
{
    EXPECT(data != nullptr || nbytes == 0, "Null pointer: data");
    return write({ static_cast<const std::byte*>(data), nbytes });
}

size_t
BackupWriter_s::write(std::span<const std::byte> data)
{
    return layers_->write(data);
}

void
BackupWriter_s::close()
{
    layers_->close();
    LOG_DEBUG("Closed backup writer for ", object_name_);
}

size_t
BackupWriter_s::layer_count() const noexcept
{
    return layers_->size();
}

void
BackupWriter_s::open_(std::string_view object_name,
                      const backup::Destination& destination,
                      const std::vector<backup::LayerFactory>& layers,
                      size_t pipe_buffer_bytes)
{
    object_name_ = backup::trim(object_name);
    if (object_name_.empty()) {
        throw_invalid_settings("Object name must not be empty");
    }

    if (destination.kind != BackupDestination_Filesystem &&
        destination.kind != BackupDestination_ObjectStore) {
        throw_invalid_settings(
          "Don't know how to handle destination kind " +
          std::to_string(static_cast<int>(destination.kind)));
    }

    if (pipe_buffer_bytes == 0) {
        pipe_buffer_bytes = backup::BoundedPipe::default_capacity;
    }

    backup::SinkCreator creator(pipe_buffer_bytes);
    layers_ = std::make_unique<backup::LayerStack>(
      creator.make_sink(destination, object_name_));

    try {
        for (const auto& make_layer : layers) {
            if (auto layer = make_layer(layers_->top())) {
                layers_->push(std::move(layer));
            }
        }
    } catch (const std::exception& exc) {
        std::string err = "Cannot open backup writer for " + object_name_ +
                          ": " + exc.what();
        if (const auto errors = layers_->abort(exc.what()); !errors.empty()) {
            err += " (" + errors + ")";
        }
        LOG_ERROR(err);
        throw backup::ConstructionError(err);
    }

    LOG_DEBUG("Opened backup writer for ",
              object_name_,
              " with ",
              layers_->size(),
              " layer(s)");
}
