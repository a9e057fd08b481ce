/**
 * @file image_service.hpp
 * @brief Submission and retrieval of degraded images
 *
 * The image service ties the codecs, the bitcrush transform, the
 * identifier generator and the artifact store together. It is the only
 * component the HTTP layer talks to for image traffic.
 */

#pragma once

#include "bitcrush/core/artifact_id.hpp"
#include "bitcrush/core/random_source.hpp"
#include "bitcrush/core/result.hpp"
#include "bitcrush/storage/artifact_store.hpp"
#include "bitcrush/transform/bitcrush_transform.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bitcrush::services {

/**
 * @struct image_service_options
 * @brief Tunables of the image service
 */
struct image_service_options {
    /// JPEG quality of stored artifacts
    int output_quality = 25;

    /// Degradation passes
    transform::transform_options transform;
};

/**
 * @class image_service
 * @brief Core Submit and Retrieve operations
 *
 * Thread Safety: submit() and retrieve() may be called concurrently. The
 * store is shared with other holders of the same std::shared_ptr.
 *
 * @par Example
 * @code
 * auto store = std::make_shared<storage::artifact_store>();
 * image_service service(store, make_default_random_source());
 *
 * auto id = service.submit(upload);
 * if (id.is_ok()) {
 *     auto stored = service.retrieve(id.value() + ".jpg");
 * }
 * @endcode
 */
class image_service {
public:
    /// Content type of every stored artifact
    static constexpr std::string_view kOutputContentType = "image/jpeg";

    /// Extension appended to identifiers in public references
    static constexpr std::string_view kDisplayExtension = ".jpg";

    /**
     * @brief Construct the service
     * @param store Shared artifact store, must not be null
     * @param random Entropy for the transform and the identifiers, must not be null
     * @param options Output quality and transform tunables
     * @throws std::invalid_argument for a null store or random source
     */
    image_service(std::shared_ptr<storage::artifact_store> store,
                  std::shared_ptr<random_source> random,
                  image_service_options options = {});

    image_service(const image_service&) = delete;
    image_service& operator=(const image_service&) = delete;

    /**
     * @brief Degrade an uploaded image and store the result
     *
     * @param upload Encoded JPEG, PNG, GIF, WebP, TIFF or BMP file
     * @return Identifier of the stored artifact, or
     *         error_codes::decode_error / unsupported_format when the
     *         upload is not a readable image,
     *         error_codes::encode_error when compression fails.
     *         The store is unchanged on failure.
     */
    [[nodiscard]] Result<std::string> submit(std::span<const std::uint8_t> upload);

    /**
     * @brief Run submit() on the transform pool
     *
     * The store insert happens before the future becomes ready.
     */
    [[nodiscard]] std::future<Result<std::string>> submit_async(std::vector<std::uint8_t> upload);

    /**
     * @brief Look up an artifact by its public token
     *
     * @param token Identifier, optionally followed by ".<extension>"
     * @return The artifact, error_codes::invalid_identifier for a malformed
     *         token or error_codes::not_found when no artifact matches
     */
    [[nodiscard]] Result<storage::artifact> retrieve(std::string_view token) const;

    /**
     * @brief Extract the canonical identifier from a public token
     *
     * Everything from the first '.' on is ignored.
     */
    [[nodiscard]] static Result<std::string> parse_token(std::string_view token);

    /**
     * @brief Public reference of an artifact, e.g. "/images/<id>.jpg"
     */
    [[nodiscard]] static std::string src_for(std::string_view id);

    [[nodiscard]] const std::shared_ptr<storage::artifact_store>& store() const noexcept {
        return store_;
    }

    [[nodiscard]] const image_service_options& options() const noexcept { return options_; }

private:
    std::shared_ptr<storage::artifact_store> store_;
    image_service_options options_;
    transform::bitcrush_transform transform_;
    artifact_id_generator ids_;
};

}  // namespace bitcrush::services
