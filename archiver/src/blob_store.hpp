#pragma once

#include "types.hpp"
#include <optional>
#include <string>

class BlobStore {
public:
    virtual ~BlobStore() = default;

    // Metadata-only existence check
    virtual BucketProbe head_bucket(const std::string& bucket) = 0;

    // location_constraint is empty for the provider's default region
    virtual StorageOutcome create_bucket(
        const std::string& bucket,
        const std::optional<std::string>& location_constraint
    ) = 0;

    virtual StorageOutcome put_object(
        const std::string& bucket,
        const std::string& key,
        const std::string& body,
        const std::string& content_type
    ) = 0;

    // Region resolved from the ambient environment
    virtual std::string region() const = 0;
};
