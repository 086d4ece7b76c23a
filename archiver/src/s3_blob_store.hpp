#pragma once

#include "blob_store.hpp"
#include <memory>
#include <string>

// Aws::InitAPI / Aws::ShutdownAPI for the lifetime of the object.
// Every S3BlobStore must be destroyed before its session.
class AwsSdkSession {
public:
    AwsSdkSession();
    ~AwsSdkSession();

    AwsSdkSession(const AwsSdkSession&) = delete;
    AwsSdkSession& operator=(const AwsSdkSession&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

class S3BlobStore : public BlobStore {
public:
    S3BlobStore();
    ~S3BlobStore() override;

    BucketProbe head_bucket(const std::string& bucket) override;
    StorageOutcome create_bucket(
        const std::string& bucket,
        const std::optional<std::string>& location_constraint
    ) override;
    StorageOutcome put_object(
        const std::string& bucket,
        const std::string& key,
        const std::string& body,
        const std::string& content_type
    ) override;
    std::string region() const override;

    // Non-copyable
    S3BlobStore(const S3BlobStore&) = delete;
    S3BlobStore& operator=(const S3BlobStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
