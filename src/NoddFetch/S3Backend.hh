/***************************************************************
 *
 * Copyright (C) 2025, Pelican Project, Morgridge Institute for Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you
 * may not use this file except in compliance with the License.  You may
 * obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 ***************************************************************/

#ifndef NODDFETCH_S3BACKEND_HH
#define NODDFETCH_S3BACKEND_HH

#include "CurlBackend.hh"

namespace NoddFetch {

// Anonymous access to a public S3 bucket over its REST interface.
class S3Backend final : public CurlBackend {
public:
    virtual ~S3Backend() {}

    // Accepts a bare bucket name or an "s3://bucket" URL.
    static std::unique_ptr<Backend> Create(const std::string &source, const Settings &settings,
        XrdCl::Log *log, std::string &err);

    // Returns the bucket name from a bare name or "s3://bucket[/...]" source.
    static std::string BucketFromSource(const std::string &source);

    // Given a bucket and object key, return the corresponding HTTPS URL.
    //
    // Without a custom endpoint, the AWS virtual-hosted style is used
    // (https://bucket.s3.region.amazonaws.com/key); otherwise path style
    // (endpoint/bucket/key).
    static std::string GenerateHttpUrl(const std::string &bucket, const std::string &key,
        const std::string &region, const std::string &endpoint);

    // Parse one page of a ListObjectsV2 response, appending the object keys
    // to `keys` and setting `next_token` to the continuation token (empty on
    // the last page).
    static bool ParseListResponse(const std::string &xml, std::vector<std::string> &keys,
        std::string &next_token, std::string &err);

    // Returns the <Code> element of an S3 error document, or an empty string.
    static std::string ParseErrorCode(const std::string &xml);

    XrdCl::XRootDStatus ListMatches(const std::string &prefix, const std::string &pattern,
        std::vector<std::string> &keys) override;

    bool CanSubset() const override {return true;}

    std::unique_ptr<Backend> Clone() const override;

    XrdCl::XRootDStatus ToStatus(const Response &resp, const std::string &body,
        const std::string &url) const override;

protected:
    std::string ObjectUrl(const std::string &key) const override;

private:
    S3Backend(const std::string &bucket, const Settings &settings, XrdCl::Log *log)
        : CurlBackend(bucket, "s3://" + bucket + "/", settings, log)
    {}
};

}

#endif // NODDFETCH_S3BACKEND_HH
