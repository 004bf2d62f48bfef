#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>

#include "Core/Client/DNS.hpp"
#include "TestUtils.hpp"

namespace cfgadguard::test {

class DNSTest : public ::testing::Test {
protected:
    DNS::Params Params(Process::Command reload = {"true", {}})
    {
        DNS::Params p;
        p.reload               = std::move(reload);
        p.flush_resolved_cache = false;
        return p;
    }

    TestUtils::TempDir mDir;
};

TEST_F(DNSTest, ActivateWritesExtendedTemplate)
{
    const auto path = mDir.File("head");

    {
        ResolvHead::File head(path.string());
        DNS dns(head, Params());
        dns.Activate();
    }

    const auto content = TestUtils::ReadFile(path);
    EXPECT_EQ(content, ResolvHead::ExtendedTemplate());
    EXPECT_NE(content.find(ResolvHead::ProviderBlock()), std::string::npos);
}

TEST_F(DNSTest, DeactivateWritesOnlyBaseTemplate)
{
    const auto path = mDir.File("head");

    {
        ResolvHead::File head(path.string());
        DNS dns(head, Params());
        dns.Deactivate();
    }

    const auto content = TestUtils::ReadFile(path);
    EXPECT_EQ(content, ResolvHead::BaseTemplate());
    EXPECT_EQ(content.find(ResolvHead::ProviderBlock()), std::string::npos);
}

TEST_F(DNSTest, ReloadRunsAfterWrite)
{
    const auto path   = mDir.File("head");
    const auto marker = mDir.File("reloaded");

    // reload копирует head — значит, к моменту запуска файл уже записан
    const std::string script = "cp '" + path.string() + "' '" + marker.string() + "'";

    {
        ResolvHead::File head(path.string());
        DNS dns(head, Params({"sh", {"-c", script}}));
        dns.Activate();
    }

    EXPECT_EQ(TestUtils::ReadFile(marker), ResolvHead::ExtendedTemplate());
}

TEST_F(DNSTest, FailingReloadIsNotFatal)
{
    const auto path = mDir.File("head");

    ResolvHead::File head(path.string());
    DNS dns(head, Params({"false", {}}));

    EXPECT_NO_THROW(dns.Deactivate());
    EXPECT_EQ(TestUtils::ReadFile(path), ResolvHead::BaseTemplate());
}

TEST_F(DNSTest, MissingReloadCommandPropagatesSpawnError)
{
    const auto path = mDir.File("head");

    ResolvHead::File head(path.string());
    DNS dns(head, Params({"cfg-adguard-dns-no-such-resolvconf", {"-u"}}));

    EXPECT_THROW(dns.Activate(), Process::SpawnError);
    // запись уже произошла до попытки reload
    EXPECT_EQ(TestUtils::ReadFile(path), ResolvHead::ExtendedTemplate());
}

TEST_F(DNSTest, EmptyReloadCommandIsRejected)
{
    const auto path = mDir.File("head");

    ResolvHead::File head(path.string());

    EXPECT_THROW({ DNS dns(head, Params({"", {}})); }, std::invalid_argument);
}

} // namespace cfgadguard::test
