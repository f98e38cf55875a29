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

#include "NoddFetch/Backend.hh"
#include "NoddFetch/CurlBackend.hh"
#include "NoddFetch/CurlUtil.hh"
#include "NoddFetch/S3Backend.hh"
#include "NoddFetch/WebBackend.hh"

#include <XrdCl/XrdClDefaultEnv.hh>

#include <gtest/gtest.h>

using namespace NoddFetch;

TEST(CurlUtil, Classify) {
    EXPECT_EQ(Classify(XrdCl::XRootDStatus()), ErrorClass::Ok);
    EXPECT_EQ(Classify(NotFoundStatus("missing")), ErrorClass::NotFound);

    auto [code, errnum] = HTTPStatusConvert(404);
    EXPECT_EQ(Classify(XrdCl::XRootDStatus(XrdCl::stError, code, errnum)), ErrorClass::NotFound);
    std::tie(code, errnum) = HTTPStatusConvert(410);
    EXPECT_EQ(Classify(XrdCl::XRootDStatus(XrdCl::stError, code, errnum)), ErrorClass::NotFound);
    std::tie(code, errnum) = HTTPStatusConvert(403);
    EXPECT_EQ(Classify(XrdCl::XRootDStatus(XrdCl::stError, code, errnum)), ErrorClass::Fatal);
    std::tie(code, errnum) = HTTPStatusConvert(503);
    EXPECT_EQ(Classify(XrdCl::XRootDStatus(XrdCl::stError, code, errnum)), ErrorClass::Fatal);

    std::tie(code, errnum) = CurlCodeConvert(CURLE_REMOTE_FILE_NOT_FOUND);
    EXPECT_EQ(Classify(XrdCl::XRootDStatus(XrdCl::stError, code, errnum)), ErrorClass::NotFound);
    std::tie(code, errnum) = CurlCodeConvert(CURLE_OPERATION_TIMEDOUT);
    EXPECT_EQ(code, XrdCl::errOperationExpired);
    EXPECT_EQ(Classify(XrdCl::XRootDStatus(XrdCl::stError, code, errnum)), ErrorClass::Fatal);
}

TEST(CurlUtil, HTTPStatusIsError) {
    EXPECT_FALSE(HTTPStatusIsError(200));
    EXPECT_FALSE(HTTPStatusIsError(206));
    EXPECT_TRUE(HTTPStatusIsError(404));
    EXPECT_TRUE(HTTPStatusIsError(0));
}

TEST(CurlUtil, UrlEscape) {
    EXPECT_EQ(UrlEscape("hfsa/20250131/00"), "hfsa%2F20250131%2F00");
    EXPECT_EQ(UrlEscape("a-b_c.d~e"), "a-b_c.d~e");
    EXPECT_EQ(UrlEscape("1/+=="), "1%2F%2B%3D%3D");
}

TEST(S3Backend, GenerateHttpUrl) {
    EXPECT_EQ(S3Backend::GenerateHttpUrl("noaa-hrrr-bdp-pds", "hrrr.20250131/conus/x.grib2", "us-east-1", ""),
        "https://noaa-hrrr-bdp-pds.s3.us-east-1.amazonaws.com/hrrr.20250131/conus/x.grib2");
    EXPECT_EQ(S3Backend::GenerateHttpUrl("bucket", "key", "us-east-1", "http://localhost:9000"),
        "http://localhost:9000/bucket/key");
}

TEST(S3Backend, BucketFromSource) {
    EXPECT_EQ(S3Backend::BucketFromSource("noaa-gfs-bdp-pds"), "noaa-gfs-bdp-pds");
    EXPECT_EQ(S3Backend::BucketFromSource("s3://noaa-gfs-bdp-pds"), "noaa-gfs-bdp-pds");
    EXPECT_EQ(S3Backend::BucketFromSource("s3://noaa-gfs-bdp-pds/gfs.20250131/"), "noaa-gfs-bdp-pds");
}

TEST(S3Backend, ParseListResponse) {
    const std::string page1 = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Name>noaa-nws-hafs-pds</Name>
  <Prefix>hfsa/20250131/00</Prefix>
  <KeyCount>2</KeyCount>
  <MaxKeys>1000</MaxKeys>
  <IsTruncated>true</IsTruncated>
  <NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>
  <Contents>
    <Key>hfsa/20250131/00/a.hycom.f000.grb2</Key>
    <Size>1024</Size>
  </Contents>
  <Contents>
    <Key>hfsa/20250131/00/a.hycom.f000.grb2.idx</Key>
    <Size>10</Size>
  </Contents>
</ListBucketResult>)";

    std::vector<std::string> keys;
    std::string token, err;
    ASSERT_TRUE(S3Backend::ParseListResponse(page1, keys, token, err)) << err;
    ASSERT_EQ(keys.size(), 2);
    EXPECT_EQ(keys[0], "hfsa/20250131/00/a.hycom.f000.grb2");
    EXPECT_EQ(token, "1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=");

    const std::string page2 = R"(<ListBucketResult>
  <IsTruncated>false</IsTruncated>
  <Contents><Key>hfsa/20250131/00/a.hycom.f003.grb2</Key></Contents>
</ListBucketResult>)";
    ASSERT_TRUE(S3Backend::ParseListResponse(page2, keys, token, err)) << err;
    EXPECT_EQ(keys.size(), 3);
    EXPECT_TRUE(token.empty());
}

TEST(S3Backend, ParseListResponseErrors) {
    std::vector<std::string> keys;
    std::string token, err;
    EXPECT_FALSE(S3Backend::ParseListResponse("not xml <", keys, token, err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(S3Backend::ParseListResponse("<Error><Code>NoSuchBucket</Code></Error>", keys, token, err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(S3Backend::ParseListResponse("<ListBucketResult><IsTruncated>true</IsTruncated></ListBucketResult>",
        keys, token, err));
    EXPECT_NE(err.find("continuation"), std::string::npos);
}

TEST(S3Backend, ParseErrorCode) {
    EXPECT_EQ(S3Backend::ParseErrorCode(
        "<?xml version=\"1.0\"?><Error><Code>NoSuchKey</Code><Message>The specified key does not exist.</Message>"
        "</Error>"), "NoSuchKey");
    EXPECT_EQ(S3Backend::ParseErrorCode("<Error><Message>no code</Message></Error>"), "");
    EXPECT_EQ(S3Backend::ParseErrorCode("<html>Not Found</html>"), "");
    EXPECT_EQ(S3Backend::ParseErrorCode(""), "");
}

TEST(Backend, CreateBySourcePrefix) {
    Settings settings;
    auto log = XrdCl::DefaultEnv::GetLog();

    auto [status, backend] = CreateBackend("noaa-hrrr-bdp-pds", false, settings, log);
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    EXPECT_EQ(backend->GetName(), "noaa-hrrr-bdp-pds");
    EXPECT_EQ(backend->GetURL(), "s3://noaa-hrrr-bdp-pds/");
    EXPECT_TRUE(backend->CanSubset());
    auto clone = backend->Clone();
    ASSERT_NE(clone.get(), nullptr);
    EXPECT_EQ(clone->GetURL(), backend->GetURL());

    std::tie(status, backend) = CreateBackend("noaa-hrrr-bdp-pds", true, settings, log);
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    EXPECT_EQ(backend->GetName(), "noaa-hrrr-bdp-pds.s3.amazonaws.com");
    EXPECT_EQ(backend->GetURL(), "https://noaa-hrrr-bdp-pds.s3.amazonaws.com/");

    std::vector<std::string> keys;
    auto list_status = backend->ListMatches("hrrr.20250131", "grib2", keys);
    EXPECT_EQ(list_status.code, XrdCl::errNotSupported);

    std::tie(status, backend) = CreateBackend("https://data.nssl.noaa.gov/thredds/", false, settings, log);
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    EXPECT_EQ(backend->GetName(), "data.nssl.noaa.gov");
    EXPECT_EQ(backend->GetURL(), "https://data.nssl.noaa.gov/");

    std::tie(status, backend) = CreateBackend("ftp://ftp.ncep.noaa.gov/", false, settings, log);
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    EXPECT_EQ(backend->GetName(), "ftp.ncep.noaa.gov");
    EXPECT_EQ(backend->CanSubset(), CurlSupportsProtocol("ftp"));

    std::tie(status, backend) = CreateBackend("", false, settings, log);
    EXPECT_EQ(status.code, XrdCl::errInvalidArgs);
    EXPECT_EQ(backend.get(), nullptr);

    std::tie(status, backend) = CreateBackend("httpx:/bad", false, settings, log);
    EXPECT_FALSE(status.IsOK());
}

TEST(FtpBackend, ToStatus) {
    auto [status, backend] = CreateBackend("ftp://ftp.ncep.noaa.gov/", false, Settings(),
        XrdCl::DefaultEnv::GetLog());
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    auto ftp = dynamic_cast<CurlBackend*>(backend.get());
    ASSERT_NE(ftp, nullptr);
    const std::string url = "ftp://ftp.ncep.noaa.gov/pub/data/rap.t12z.awp130pgrbf00.grib2";

    CurlBackend::Response resp;
    EXPECT_TRUE(ftp->ToStatus(resp, "", url).IsOK());

    // A missing directory surfaces as access denied; the shared mapping
    // treats that as a login failure.
    resp.code = CURLE_REMOTE_ACCESS_DENIED;
    resp.status = 550;
    EXPECT_EQ(Classify(ftp->ToStatus(resp, "", url)), ErrorClass::NotFound);
    auto [code, errnum] = CurlCodeConvert(CURLE_REMOTE_ACCESS_DENIED);
    EXPECT_EQ(Classify(XrdCl::XRootDStatus(XrdCl::stError, code, errnum)), ErrorClass::Fatal);

    resp.code = CURLE_REMOTE_FILE_NOT_FOUND;
    EXPECT_EQ(Classify(ftp->ToStatus(resp, "", url)), ErrorClass::NotFound);

    resp.code = CURLE_OPERATION_TIMEDOUT;
    resp.status = 0;
    auto timeout = ftp->ToStatus(resp, "", url);
    EXPECT_EQ(Classify(timeout), ErrorClass::Fatal);
    EXPECT_EQ(timeout.code, XrdCl::errOperationExpired);

    // FTP reply codes are not HTTP statuses; a ranged transfer is accepted as is.
    resp = CurlBackend::Response();
    resp.status = 226;
    EXPECT_TRUE(ftp->CheckRangeResponse(resp, ByteRange(100, 199), url).IsOK());
}

TEST(S3Backend, ToStatus) {
    auto [status, backend] = CreateBackend("noaa-hrrr-bdp-pds", false, Settings(), XrdCl::DefaultEnv::GetLog());
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    auto s3 = dynamic_cast<CurlBackend*>(backend.get());
    ASSERT_NE(s3, nullptr);
    const std::string url = "https://noaa-hrrr-bdp-pds.s3.us-east-1.amazonaws.com/hrrr.20250131/conus/x.grib2";

    CurlBackend::Response resp;
    resp.status = 404;
    auto missing = s3->ToStatus(resp,
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Error><Code>NoSuchKey</Code>"
        "<Message>The specified key does not exist.</Message></Error>", url);
    EXPECT_EQ(Classify(missing), ErrorClass::NotFound);
    EXPECT_NE(missing.GetErrorMessage().find("NoSuchKey"), std::string::npos);

    // Without public read access a missing key is reported as 403 NoSuchKey.
    resp.status = 403;
    EXPECT_EQ(Classify(s3->ToStatus(resp, "<Error><Code>NoSuchKey</Code></Error>", url)), ErrorClass::NotFound);

    auto denied = s3->ToStatus(resp, "<Error><Code>AccessDenied</Code></Error>", url);
    EXPECT_EQ(Classify(denied), ErrorClass::Fatal);
    EXPECT_NE(denied.GetErrorMessage().find("AccessDenied"), std::string::npos);

    resp.status = 503;
    EXPECT_EQ(Classify(s3->ToStatus(resp, "<Error><Code>SlowDown</Code></Error>", url)), ErrorClass::Fatal);

    resp.status = 200;
    EXPECT_TRUE(s3->ToStatus(resp, "GRIB", url).IsOK());

    resp.code = CURLE_COULDNT_RESOLVE_HOST;
    resp.status = 0;
    EXPECT_EQ(s3->ToStatus(resp, "", url).code, XrdCl::errInvalidAddr);
}

TEST(WebBackend, RangeResponse) {
    auto [status, backend] = CreateBackend("https://nomads.ncep.noaa.gov/", false, Settings(),
        XrdCl::DefaultEnv::GetLog());
    ASSERT_TRUE(status.IsOK()) << status.ToStr();
    auto web = dynamic_cast<CurlBackend*>(backend.get());
    ASSERT_NE(web, nullptr);
    const std::string url = "https://nomads.ncep.noaa.gov/pub/data/gfs.t00z.pgrb2.0p25.f000";

    CurlBackend::Response resp;
    resp.status = 206;
    EXPECT_TRUE(web->CheckRangeResponse(resp, ByteRange(100, 199), url).IsOK());

    // The whole object came back for a partial request.
    resp.status = 200;
    auto ignored = web->CheckRangeResponse(resp, ByteRange(100, 199), url);
    EXPECT_EQ(Classify(ignored), ErrorClass::Fatal);
    EXPECT_NE(ignored.GetErrorMessage().find("bytes=100-199"), std::string::npos);
    EXPECT_EQ(Classify(web->CheckRangeResponse(resp, ByteRange(100), url)), ErrorClass::Fatal);
    EXPECT_EQ(Classify(web->CheckRangeResponse(resp, ByteRange(0, 99), url)), ErrorClass::Fatal);

    EXPECT_TRUE(web->CheckRangeResponse(resp, ByteRange(0), url).IsOK());
    EXPECT_TRUE(web->CheckRangeResponse(resp, std::nullopt, url).IsOK());

    resp.status = 404;
    EXPECT_EQ(Classify(web->ToStatus(resp, "", url)), ErrorClass::NotFound);
}

TEST(WebBackend, SplitUrl) {
    std::string scheme, host;
    ASSERT_TRUE(WebBackend::SplitUrl("https://nomads.ncep.noaa.gov/pub/data", scheme, host));
    EXPECT_EQ(scheme, "https");
    EXPECT_EQ(host, "nomads.ncep.noaa.gov");
    EXPECT_FALSE(WebBackend::SplitUrl("nomads.ncep.noaa.gov", scheme, host));
    EXPECT_FALSE(WebBackend::SplitUrl("https://", scheme, host));
}
