#include <gtest/gtest.h>

#include "utils/Environment.hpp"
#include "utils/EnvironmentQtPolicy.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QHash>
#include <QtCore/QMap>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <QtCore/QVariant>

#include <memory>
#include <utility>

using namespace Qt::StringLiterals;

namespace {

using Utils::BasicEnvironment;
using Utils::EnvironmentConfig;
using Utils::EnvironmentPaths;
using Utils::EnvironmentScope;

struct InMemoryPersistencePolicy
{
    struct Store {
        QHash<int, QHash<QString, QVariant>> settings;
        QSet<int> failSyncScope;
        int syncCount = 0;
    };

    class SettingsHandle
    {
    public:
        SettingsHandle(std::shared_ptr<Store> store, EnvironmentScope scope)
            : m_store(std::move(store))
            , m_scope(int(scope))
        {}

        QVariant value(QStringView key, const QVariant& def) const
        {
            const auto& m = m_store->settings[m_scope];
            const auto it = m.constFind(key.toString());
            return it == m.constEnd() ? def : it.value();
        }

        void setValue(QStringView key, const QVariant& value)
        {
            m_store->settings[m_scope].insert(key.toString(), value);
        }

        void remove(QStringView key) { m_store->settings[m_scope].remove(key.toString()); }

        bool contains(QStringView key) const
        {
            return m_store->settings.value(m_scope).contains(key.toString());
        }

        QStringList childGroups(QStringView group) const
        {
            QStringList out;
            const QString prefix = group.toString() + u'/';
            const auto m = m_store->settings.value(m_scope);
            for (auto it = m.cbegin(); it != m.cend(); ++it) {
                if (!it.key().startsWith(prefix))
                    continue;
                const QString rest = it.key().mid(prefix.size());
                const qsizetype slash = rest.indexOf(u'/');
                if (slash > 0 && !out.contains(rest.left(slash)))
                    out.push_back(rest.left(slash));
            }
            return out;
        }

        bool sync(QString* error)
        {
            ++m_store->syncCount;
            if (m_store->failSyncScope.contains(m_scope)) {
                if (error) *error = u"sync failed (simulated)"_s;
                return false;
            }
            if (error) error->clear();
            return true;
        }

    private:
        std::shared_ptr<Store> m_store;
        int m_scope = 0;
    };

    std::shared_ptr<Store> store = std::make_shared<Store>();

    EnvironmentPaths resolvePaths(const EnvironmentConfig&) const
    {
        EnvironmentPaths p;
        p.configDir = u"/mem"_s;
        p.applicationSettingsFile = u"/mem/app.ini"_s;
        p.windowStateFile = u"/mem/WindowState.ini"_s;
        return p;
    }

    SettingsHandle open(EnvironmentScope scope, const EnvironmentPaths&) const
    {
        return SettingsHandle(store, scope);
    }
};

using Env = BasicEnvironment<InMemoryPersistencePolicy>;

EnvironmentConfig makeConfig()
{
    EnvironmentConfig cfg;
    cfg.organizationName = "IsopGem";
    cfg.applicationName = "IsopGem";
    return cfg;
}

} // namespace

TEST(EnvironmentTests, SettingsRoundTripAndRemove)
{
    Env env(makeConfig());

    EXPECT_FALSE(env.hasSetting(EnvironmentScope::Application, u"ui/foo"_s));
    EXPECT_TRUE(env.setSetting(EnvironmentScope::Application, u"ui/foo"_s, 123).ok());
    EXPECT_TRUE(env.hasSetting(EnvironmentScope::Application, u"ui/foo"_s));
    EXPECT_EQ(env.setting(EnvironmentScope::Application, u"ui/foo"_s).toInt(), 123);

    EXPECT_TRUE(env.removeSetting(EnvironmentScope::Application, u"ui/foo"_s).ok());
    EXPECT_FALSE(env.hasSetting(EnvironmentScope::Application, u"ui/foo"_s));
    EXPECT_EQ(env.setting(EnvironmentScope::Application, u"ui/foo"_s, 42).toInt(), 42);
}

TEST(EnvironmentTests, ScopesAreIsolated)
{
    Env env(makeConfig());

    ASSERT_TRUE(env.setSetting(EnvironmentScope::WindowState, u"panels/a/visible"_s, true).ok());
    EXPECT_FALSE(env.hasSetting(EnvironmentScope::Application, u"panels/a/visible"_s));
    EXPECT_TRUE(env.hasSetting(EnvironmentScope::WindowState, u"panels/a/visible"_s));
}

TEST(EnvironmentTests, SetSettingsWritesAllKeysWithOneSync)
{
    Env env(makeConfig());

    QMap<QString, QVariant> values;
    values.insert(u"panels/a/visible"_s, true);
    values.insert(u"panels/a/floating"_s, false);
    values.insert(u"panels/b/visible"_s, false);

    const int before = env.policy().store->syncCount;
    ASSERT_TRUE(env.setSettings(EnvironmentScope::WindowState, values).ok());
    EXPECT_EQ(env.policy().store->syncCount, before + 1);

    EXPECT_TRUE(env.setting(EnvironmentScope::WindowState, u"panels/a/visible"_s).toBool());
    EXPECT_FALSE(env.setting(EnvironmentScope::WindowState, u"panels/b/visible"_s, true).toBool());
}

TEST(EnvironmentTests, EmptyBatchDoesNotTouchStorage)
{
    Env env(makeConfig());
    env.policy().store->failSyncScope.insert(int(EnvironmentScope::WindowState));

    EXPECT_TRUE(env.setSettings(EnvironmentScope::WindowState, QMap<QString, QVariant>{}).ok());
    EXPECT_EQ(env.policy().store->syncCount, 0);
}

TEST(EnvironmentTests, SyncFailureIsReportedWithKey)
{
    Env env(makeConfig());
    env.policy().store->failSyncScope.insert(int(EnvironmentScope::WindowState));

    const auto r = env.setSetting(EnvironmentScope::WindowState, u"panels/a/geometry"_s, QByteArray("x"));
    EXPECT_FALSE(r.ok());
    ASSERT_EQ(r.errorCount(), 1);
    EXPECT_EQ(r.failedSubjects(), QStringList{u"panels/a/geometry"_s});
    EXPECT_TRUE(r.message().contains(u"panels/a/geometry"_s));
    EXPECT_TRUE(r.message().contains(u"simulated"_s));

    EXPECT_TRUE(env.setSetting(EnvironmentScope::Application, u"ui/foo"_s, 1).ok());
}

TEST(EnvironmentTests, ChildGroupsListsDirectChildren)
{
    Env env(makeConfig());

    ASSERT_TRUE(env.setSetting(EnvironmentScope::WindowState, u"panels/alpha/visible"_s, true).ok());
    ASSERT_TRUE(env.setSetting(EnvironmentScope::WindowState, u"panels/beta/geometry"_s, QByteArray("g")).ok());
    ASSERT_TRUE(env.setSetting(EnvironmentScope::WindowState, u"auxiliaryWindows/gamma/visible"_s, true).ok());

    QStringList groups = env.childGroups(EnvironmentScope::WindowState, u"panels"_s);
    groups.sort();
    EXPECT_EQ(groups, (QStringList{u"alpha"_s, u"beta"_s}));
}

TEST(EnvironmentTests, QtPolicyResolvesPathsUnderOverride)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    EnvironmentConfig cfg = makeConfig();
    cfg.configRootOverride = temp.path();
    Utils::Environment env(cfg);

    EXPECT_EQ(env.paths().configDir, QDir(temp.path()).filePath(u"IsopGem"_s));
    EXPECT_TRUE(env.paths().applicationSettingsFile.endsWith(u"IsopGem.ini"_s));
    EXPECT_TRUE(env.paths().windowStateFile.endsWith(u"WindowState.ini"_s));
}

TEST(EnvironmentTests, QtPolicyPersistsToIniFile)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    EnvironmentConfig cfg = makeConfig();
    cfg.configRootOverride = temp.path();

    {
        Utils::Environment env(cfg);
        ASSERT_TRUE(env.setSetting(EnvironmentScope::WindowState, u"mainWindow/geometry"_s,
                                   QByteArray("abc")).ok());
        EXPECT_TRUE(QFileInfo::exists(env.paths().windowStateFile));
    }

    Utils::Environment reopened(cfg);
    EXPECT_EQ(reopened.setting(EnvironmentScope::WindowState, u"mainWindow/geometry"_s).toByteArray(),
              QByteArray("abc"));
    EXPECT_FALSE(reopened.hasSetting(EnvironmentScope::Application, u"mainWindow/geometry"_s));
}
