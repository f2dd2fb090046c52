#include <gtest/gtest.h>
#include <string>
#include "tapcore/errors.hpp"
#include "tapcore/request_authenticator.hpp"
#include "test_support.hpp"

using namespace tapcore;
using tapcore::testing::TEST_SECRET;

namespace {

const char* KNOWN_USER = R"({"id":279058397,"first_name":"Vladislav","username":"vdkfrost"})";
const char* KNOWN_HASH = "3d2e5c792e3e72fd03db755e5b8c1fe02f83817716b6ece12feeacda5ae7a90e";

std::string known_payload(const std::string& hash = KNOWN_HASH) {
    return tapcore::testing::to_query({
        {"auth_date", "1700000000"},
        {"query_id", "AAHdF6IQAAAAAN0XohDhrOrc"},
        {"user", KNOWN_USER},
        {"hash", hash},
    });
}

AuthErrorKind rejection_kind(const std::string& init_data) {
    try {
        RequestAuthenticator::verify(init_data, TEST_SECRET);
    } catch (const AuthError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected AuthError";
    return AuthErrorKind::MissingCredential;
}

} // anonymous namespace

// =============================================================================
// Successful Verification
// =============================================================================

TEST(RequestAuthenticatorTest, KnownVector_ShouldVerifyAndExtractIdentity) {
    RequestAuthenticator auth(TEST_SECRET);

    auto credential = auth.verify(known_payload());

    EXPECT_EQ(credential.identity.id, 279058397);
    ASSERT_TRUE(credential.identity.username.has_value());
    EXPECT_EQ(*credential.identity.username, "vdkfrost");
    EXPECT_EQ(*credential.identity.first_name, "Vladislav");
    EXPECT_FALSE(credential.identity.last_name.has_value());
    EXPECT_FALSE(credential.identity.photo_url.has_value());
}

TEST(RequestAuthenticatorTest, VerifiedFields_ShouldExcludeHash) {
    auto credential = RequestAuthenticator::verify(known_payload(), TEST_SECRET);

    EXPECT_EQ(credential.fields.size(), 3u);
    EXPECT_EQ(credential.fields.count("hash"), 0u);
    EXPECT_EQ(credential.fields.at("auth_date"), "1700000000");
}

TEST(RequestAuthenticatorTest, Sign_ShouldMatchKnownVector) {
    std::map<std::string, std::string> fields = {
        {"auth_date", "1700000000"},
        {"query_id", "AAHdF6IQAAAAAN0XohDhrOrc"},
        {"user", KNOWN_USER},
    };
    EXPECT_EQ(RequestAuthenticator::sign(fields, TEST_SECRET), KNOWN_HASH);
}

TEST(RequestAuthenticatorTest, ReorderedFields_ShouldVerifyIdentically) {
    std::string reordered = tapcore::testing::to_query({
        {"hash", KNOWN_HASH},
        {"user", KNOWN_USER},
        {"query_id", "AAHdF6IQAAAAAN0XohDhrOrc"},
        {"auth_date", "1700000000"},
    });

    auto a = RequestAuthenticator::verify(known_payload(), TEST_SECRET);
    auto b = RequestAuthenticator::verify(reordered, TEST_SECRET);

    EXPECT_EQ(a.identity.id, b.identity.id);
    EXPECT_EQ(a.fields, b.fields);
}

TEST(RequestAuthenticatorTest, PlusEncodedSpaces_ShouldDecodeBeforeSigning) {
    std::map<std::string, std::string> fields = {
        {"user", R"({"id":7,"first_name":"Ann Lee"})"},
    };
    std::string hash = RequestAuthenticator::sign(fields, TEST_SECRET);
    std::string init_data =
        "user=%7B%22id%22%3A7%2C%22first_name%22%3A%22Ann+Lee%22%7D&hash=" + hash;

    auto credential = RequestAuthenticator::verify(init_data, TEST_SECRET);

    EXPECT_EQ(*credential.identity.first_name, "Ann Lee");
}

TEST(RequestAuthenticatorTest, EmptyDisplayFields_ShouldBeTreatedAsAbsent) {
    auto init_data = tapcore::testing::signed_init_data(
        {{"id", 42}, {"username", ""}, {"photo_url", "https://example.org/a.png"}});

    auto credential = RequestAuthenticator::verify(init_data, TEST_SECRET);

    EXPECT_FALSE(credential.identity.username.has_value());
    EXPECT_EQ(*credential.identity.photo_url, "https://example.org/a.png");
}

// =============================================================================
// Canonical String
// =============================================================================

TEST(RequestAuthenticatorTest, DataCheckString_ShouldSortByNameWithoutTrailingNewline) {
    std::map<std::string, std::string> fields = {
        {"user", "u"}, {"auth_date", "1"}, {"Zeta", "z"}, {"hash", "ignored"},
    };

    // Byte-wise order puts uppercase before lowercase.
    EXPECT_EQ(RequestAuthenticator::data_check_string(fields), "Zeta=z\nauth_date=1\nuser=u");
}

TEST(RequestAuthenticatorTest, ParseFields_RepeatedName_ShouldKeepLastValue) {
    auto fields = RequestAuthenticator::parse_fields("a=1&b=2&a=3&&flag");

    EXPECT_EQ(fields.at("a"), "3");
    EXPECT_EQ(fields.at("b"), "2");
    EXPECT_EQ(fields.at("flag"), "");
    EXPECT_EQ(fields.size(), 3u);
}

// =============================================================================
// Rejections
// =============================================================================

TEST(RequestAuthenticatorTest, EmptyBlob_ShouldFailWithMissingCredential) {
    EXPECT_EQ(rejection_kind(""), AuthErrorKind::MissingCredential);
}

TEST(RequestAuthenticatorTest, NoHashField_ShouldFailWithMissingSignature) {
    std::string init_data = tapcore::testing::to_query({{"auth_date", "1"}, {"user", KNOWN_USER}});
    EXPECT_EQ(rejection_kind(init_data), AuthErrorKind::MissingSignature);
}

TEST(RequestAuthenticatorTest, WrongHash_ShouldFailWithBadSignature) {
    std::string tampered = KNOWN_HASH;
    tampered[0] = tampered[0] == '0' ? '1' : '0';
    EXPECT_EQ(rejection_kind(known_payload(tampered)), AuthErrorKind::BadSignature);
}

TEST(RequestAuthenticatorTest, UppercaseHash_ShouldFailWithBadSignature) {
    std::string upper = KNOWN_HASH;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_EQ(rejection_kind(known_payload(upper)), AuthErrorKind::BadSignature);
}

TEST(RequestAuthenticatorTest, WrongSecret_ShouldFailWithBadSignature) {
    EXPECT_THROW(RequestAuthenticator::verify(known_payload(), "another-secret"), AuthError);
}

TEST(RequestAuthenticatorTest, AnySingleCharacterChange_ShouldBreakSignature) {
    std::map<std::string, std::string> fields = {
        {"auth_date", "1700000000"},
        {"query_id", "AAHdF6IQAAAAAN0XohDhrOrc"},
        {"user", KNOWN_USER},
    };
    std::string canonical = RequestAuthenticator::data_check_string(fields);

    for (auto& [name, value] : fields) {
        for (size_t i = 0; i < value.size(); ++i) {
            auto perturbed = fields;
            perturbed[name][i] = static_cast<char>(perturbed[name][i] ^ 0x01);
            ASSERT_NE(RequestAuthenticator::data_check_string(perturbed), canonical);
            EXPECT_NE(RequestAuthenticator::sign(perturbed, TEST_SECRET), KNOWN_HASH)
                << "field " << name << " offset " << i;
        }
    }
}

TEST(RequestAuthenticatorTest, SignedPayloadWithoutUser_ShouldFailWithMissingIdentity) {
    std::map<std::string, std::string> fields = {{"auth_date", "1700000000"}};
    std::string hash = RequestAuthenticator::sign(fields, TEST_SECRET);
    std::string init_data = tapcore::testing::to_query({{"auth_date", "1700000000"}, {"hash", hash}});

    EXPECT_EQ(rejection_kind(init_data), AuthErrorKind::MissingIdentity);
}

TEST(RequestAuthenticatorTest, UserWithoutId_ShouldFailWithMissingIdentity) {
    auto init_data = tapcore::testing::signed_init_data({{"username", "nobody"}});
    EXPECT_EQ(rejection_kind(init_data), AuthErrorKind::MissingIdentity);
}

TEST(RequestAuthenticatorTest, MalformedUserJson_ShouldFailWithMissingIdentity) {
    std::map<std::string, std::string> fields = {{"user", "{not json"}};
    std::string hash = RequestAuthenticator::sign(fields, TEST_SECRET);
    std::string init_data = tapcore::testing::to_query({{"user", "{not json"}, {"hash", hash}});

    EXPECT_EQ(rejection_kind(init_data), AuthErrorKind::MissingIdentity);
}

TEST(RequestAuthenticatorTest, AuthError_ShouldMapToUnauthenticated) {
    try {
        RequestAuthenticator::verify("", TEST_SECRET);
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_TRUE(e.is_unauthenticated());
        EXPECT_EQ(e.to_grpc_status().error_code(), grpc::StatusCode::UNAUTHENTICATED);
        EXPECT_STREQ(e.what(), "Missing initData");
    }
}
