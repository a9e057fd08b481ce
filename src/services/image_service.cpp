/**
 * @file image_service.cpp
 * @brief Implementation of image submission and retrieval
 */

#include "bitcrush/services/image_service.hpp"

#include "bitcrush/encoding/compression/codec_factory.hpp"
#include "bitcrush/integration/logger_adapter.hpp"
#include "bitcrush/integration/thread_adapter.hpp"

#include <chrono>
#include <stdexcept>

namespace bitcrush::services {

using encoding::compression::codec_factory;
using encoding::compression::compression_options;
using encoding::compression::jpeg_codec;
using integration::logger_adapter;

image_service::image_service(std::shared_ptr<storage::artifact_store> store,
                             std::shared_ptr<random_source> random,
                             image_service_options options)
    : store_(std::move(store)),
      options_(options),
      transform_(random, options.transform),
      ids_(random) {
    if (!store_) {
        throw std::invalid_argument("image_service requires an artifact store");
    }
}

Result<std::string> image_service::submit(std::span<const std::uint8_t> upload) {
    const auto started = std::chrono::steady_clock::now();

    auto decoded = codec_factory::decode_any(upload);
    if (decoded.is_err()) {
        return decoded.error();
    }

    imaging::image_buffer source(std::move(decoded.value()));
    logger_adapter::debug("decoded upload: {}x{}, {} channel(s)",
                          source.width(), source.height(), source.channels());

    auto degraded = transform_.apply(source);
    if (degraded.is_err()) {
        return degraded.error();
    }

    compression_options output_options;
    output_options.quality = options_.output_quality;

    const jpeg_codec codec;
    auto encoded = codec.encode(degraded.value().view(), degraded.value().params,
                                output_options);
    if (encoded.is_err()) {
        return encoded.error();
    }

    auto id = ids_.generate();
    const auto output_bytes = encoded.value().data.size();
    store_->insert(id, storage::artifact{std::string(kOutputContentType),
                                         std::move(encoded.value().data)});

    logger_adapter::log_submission(
        id, upload.size(), output_bytes,
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started));

    return ok<std::string>(std::move(id));
}

std::future<Result<std::string>> image_service::submit_async(std::vector<std::uint8_t> upload) {
    return integration::thread_adapter::submit(
        [this, bytes = std::move(upload)]() { return submit(bytes); });
}

Result<storage::artifact> image_service::retrieve(std::string_view token) const {
    auto id = parse_token(token);
    if (id.is_err()) {
        return id.error();
    }

    auto found = store_->find(id.value());
    logger_adapter::log_retrieval(id.value(), found.has_value());
    if (!found) {
        return bitcrush_error<storage::artifact>(error_codes::not_found,
                                                 "Artifact not found", id.value());
    }
    return ok<storage::artifact>(std::move(*found));
}

Result<std::string> image_service::parse_token(std::string_view token) {
    const auto id = token.substr(0, token.find('.'));
    if (id.empty()) {
        return bitcrush_error<std::string>(error_codes::invalid_identifier,
                                           "Empty artifact identifier");
    }

    auto canonical = artifact_id_generator::normalize(id);
    if (!canonical) {
        return bitcrush_error<std::string>(error_codes::invalid_identifier,
                                           "Malformed artifact identifier", std::string(id));
    }
    return ok<std::string>(std::move(*canonical));
}

std::string image_service::src_for(std::string_view id) {
    std::string src = "/images/";
    src.append(id);
    src.append(kDisplayExtension);
    return src;
}

}  // namespace bitcrush::services
