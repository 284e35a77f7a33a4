#include "secrets/SecretsResolver.hpp"

#include "common/Errors.hpp"
#include "support/Fakes.hpp"

#include <gtest/gtest.h>

using dockops::common::SecretNotFoundError;
using dockops::common::StackDeclaration;
using dockops::secrets::SecretsResolver;
using dockops::test::FakeSecretStore;

namespace {

StackDeclaration stackWithSecrets(std::vector<dockops::common::SecretSpec> vSecrets) {
  StackDeclaration sd;
  sd.sName = "web";
  sd.vSecrets = std::move(vSecrets);
  return sd;
}

}  // namespace

TEST(SecretsResolverTest, MapsEnvNamesToValues) {
  FakeSecretStore fss;
  fss.mSecrets = {{"db_password", "hunter2"}, {"api_token", "t0k3n"}};
  SecretsResolver sr(fss);

  auto env = sr.resolve(stackWithSecrets({{"db_password", "DB_PASSWORD"}, {"api_token", "TOKEN"}}));
  ASSERT_EQ(env.size(), 2u);
  EXPECT_EQ(env["DB_PASSWORD"], "hunter2");
  EXPECT_EQ(env["TOKEN"], "t0k3n");
}

TEST(SecretsResolverTest, NoSecretsYieldsEmptyEnvironment) {
  FakeSecretStore fss;
  SecretsResolver sr(fss);
  EXPECT_TRUE(sr.resolve(stackWithSecrets({})).empty());
}

TEST(SecretsResolverTest, MissingSecretThrowsNamingEveryMissingId) {
  FakeSecretStore fss;
  fss.mSecrets = {{"present", "value"}};
  SecretsResolver sr(fss);

  try {
    sr.resolve(stackWithSecrets({{"absent_one", "A"}, {"present", "P"}, {"absent_two", "B"}}));
    FAIL() << "expected SecretNotFoundError";
  } catch (const SecretNotFoundError& ex) {
    const std::string sMsg = ex.what();
    EXPECT_EQ(ex._sErrorCode, "secret_missing");
    EXPECT_NE(sMsg.find("web"), std::string::npos);
    EXPECT_NE(sMsg.find("absent_one"), std::string::npos);
    EXPECT_NE(sMsg.find("absent_two"), std::string::npos);
    EXPECT_EQ(sMsg.find("value"), std::string::npos);
  }
}
