#include "s3_blob_store.hpp"
#include "util.hpp"
#include <aws/core/Aws.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/CreateBucketConfiguration.h>
#include <aws/s3/model/BucketLocationConstraint.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <spdlog/spdlog.h>

namespace {

const char* kAllocationTag = "WeatherArchiver";

template<typename ErrorT>
StorageOutcome to_failure(const ErrorT& error) {
    StorageOutcome outcome;
    outcome.ok = false;
    auto http_status = static_cast<int>(error.GetResponseCode());
    outcome.error_code = std::to_string(http_status);
    outcome.message = util::describe_storage_error(
        error.GetExceptionName().c_str(), error.GetMessage().c_str(), http_status);
    return outcome;
}

} // namespace

class AwsSdkSession::Impl {
public:
    Impl() {
        Aws::InitAPI(options_);
        spdlog::debug("AWS SDK initialized");
    }

    ~Impl() {
        Aws::ShutdownAPI(options_);
    }

private:
    Aws::SDKOptions options_;
};

AwsSdkSession::AwsSdkSession() : pImpl_(std::make_unique<Impl>()) {}
AwsSdkSession::~AwsSdkSession() = default;

class S3BlobStore::Impl {
public:
    Impl() : client_config_(), client_(client_config_) {
        // The default configuration resolves region from AWS_REGION,
        // the shared config file, or falls back to us-east-1.
        region_ = std::string(client_config_.region.c_str());
        spdlog::info("S3 client initialized for region {}", region_);
    }

    BucketProbe head_bucket(const std::string& bucket) {
        BucketProbe probe;

        Aws::S3::Model::HeadBucketRequest request;
        request.SetBucket(bucket.c_str());

        auto result = client_.HeadBucket(request);
        if (result.IsSuccess()) {
            probe.state = BucketState::Exists;
            probe.outcome.ok = true;
            return probe;
        }

        const auto& error = result.GetError();
        probe.outcome = to_failure(error);
        probe.state = error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND
            ? BucketState::NotFound
            : BucketState::Error;
        return probe;
    }

    StorageOutcome create_bucket(
        const std::string& bucket,
        const std::optional<std::string>& location_constraint
    ) {
        Aws::S3::Model::CreateBucketRequest request;
        request.SetBucket(bucket.c_str());

        if (location_constraint) {
            Aws::S3::Model::CreateBucketConfiguration bucket_config;
            bucket_config.SetLocationConstraint(
                Aws::S3::Model::BucketLocationConstraintMapper::GetBucketLocationConstraintForName(
                    location_constraint->c_str()));
            request.SetCreateBucketConfiguration(bucket_config);
        }

        auto result = client_.CreateBucket(request);
        if (!result.IsSuccess()) {
            return to_failure(result.GetError());
        }

        StorageOutcome outcome;
        outcome.ok = true;
        return outcome;
    }

    StorageOutcome put_object(
        const std::string& bucket,
        const std::string& key,
        const std::string& body,
        const std::string& content_type
    ) {
        Aws::S3::Model::PutObjectRequest request;
        request.SetBucket(bucket.c_str());
        request.SetKey(key.c_str());
        request.SetContentType(content_type.c_str());

        auto stream = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
        *stream << body;
        request.SetBody(stream);

        auto result = client_.PutObject(request);
        if (!result.IsSuccess()) {
            return to_failure(result.GetError());
        }

        StorageOutcome outcome;
        outcome.ok = true;
        return outcome;
    }

    std::string region() const {
        return region_;
    }

private:
    Aws::Client::ClientConfiguration client_config_;
    Aws::S3::S3Client client_;
    std::string region_;
};

// --- PIMPL forward declarations ---
S3BlobStore::S3BlobStore() : pImpl_(std::make_unique<Impl>()) {}
S3BlobStore::~S3BlobStore() = default;
BucketProbe S3BlobStore::head_bucket(const std::string& bucket) {
    return pImpl_->head_bucket(bucket);
}
StorageOutcome S3BlobStore::create_bucket(const std::string& bucket, const std::optional<std::string>& location_constraint) {
    return pImpl_->create_bucket(bucket, location_constraint);
}
StorageOutcome S3BlobStore::put_object(const std::string& bucket, const std::string& key, const std::string& body, const std::string& content_type) {
    return pImpl_->put_object(bucket, key, body, content_type);
}
std::string S3BlobStore::region() const {
    return pImpl_->region();
}
