#include <QtTest/QtTest>

#include <atomic>
#include <thread>

#include "supervisor/domain_registry.hpp"

class DomainRegistryTests : public QObject
{
    Q_OBJECT
private slots:
    void testLookupMissReturnsNull();
    void testReplaceSwapsWholeMap();
    void testReadersSeeCompleteSnapshots();
    void testFolderSyncingPaths();
    void testDeviceConnectivity();
    void testIgnoreMatching();
};

namespace {

syncwarden::FolderMap makeFolders(std::initializer_list<const char *> ids)
{
    syncwarden::FolderMap folders;
    for (const char *id : ids) {
        folders.emplace(id, std::make_shared<syncwarden::Folder>(
                                id, std::string("/data/") + id, syncwarden::FolderIgnores()));
    }
    return folders;
}

} // namespace

void DomainRegistryTests::testLookupMissReturnsNull()
{
    syncwarden::DomainRegistry registry;
    QVERIFY(!registry.lookupFolder("default"));
    QVERIFY(!registry.lookupDevice("XYZ"));
    QVERIFY(registry.allFolders().empty());
    QVERIFY(registry.allDevices().empty());
}

void DomainRegistryTests::testReplaceSwapsWholeMap()
{
    syncwarden::DomainRegistry registry;
    registry.replaceFolders(makeFolders({"a", "b"}));
    const auto oldA = registry.lookupFolder("a");
    QVERIFY(oldA);
    QCOMPARE(registry.allFolders().size(), static_cast<size_t>(2));

    registry.replaceFolders(makeFolders({"b", "c"}));
    QVERIFY(!registry.lookupFolder("a"));
    QVERIFY(registry.lookupFolder("c"));
    // Entities handed out earlier stay usable.
    QCOMPARE(QString::fromStdString(oldA->path()), QStringLiteral("/data/a"));

    syncwarden::DeviceMap devices;
    devices.emplace("DEV1", std::make_shared<syncwarden::Device>("DEV1", "laptop"));
    registry.replaceDevices(std::move(devices));
    QCOMPARE(QString::fromStdString(registry.lookupDevice("DEV1")->name()), QStringLiteral("laptop"));
    QCOMPARE(registry.allDevices().size(), static_cast<size_t>(1));
}

void DomainRegistryTests::testReadersSeeCompleteSnapshots()
{
    syncwarden::DomainRegistry registry;
    registry.replaceFolders(makeFolders({"a1", "a2", "a3"}));

    std::atomic<bool> done{false};
    std::atomic<int> partial{0};
    std::thread reader([&]() {
        while (!done) {
            const auto folders = registry.allFolders();
            if (folders.size() != 3) {
                ++partial;
                continue;
            }
            const char prefix = folders.front()->folderId().front();
            for (const auto &folder : folders) {
                if (folder->folderId().front() != prefix) {
                    ++partial;
                }
            }
        }
    });

    for (int i = 0; i < 500; ++i) {
        registry.replaceFolders(i % 2 == 0 ? makeFolders({"b1", "b2", "b3"})
                                           : makeFolders({"a1", "a2", "a3"}));
    }
    done = true;
    reader.join();

    QCOMPARE(partial.load(), 0);
}

void DomainRegistryTests::testFolderSyncingPaths()
{
    syncwarden::Folder folder("default", "/home/user/sync", syncwarden::FolderIgnores());
    QCOMPARE(folder.syncState(), syncwarden::FolderSyncState::Idle);

    folder.addSyncingPath("b.txt");
    folder.addSyncingPath("a.txt");
    folder.addSyncingPath("a.txt");
    QCOMPARE(folder.syncingPaths().size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(folder.syncingPaths().front()), QStringLiteral("a.txt"));

    folder.removeSyncingPath("a.txt");
    folder.removeSyncingPath("never-added");
    QVERIFY(!folder.isSyncingPath("a.txt"));
    QVERIFY(folder.isSyncingPath("b.txt"));

    folder.setSyncState(syncwarden::FolderSyncState::Scanning);
    QCOMPARE(folder.syncState(), syncwarden::FolderSyncState::Scanning);
}

void DomainRegistryTests::testDeviceConnectivity()
{
    syncwarden::Device device("DEV1", "laptop");
    QVERIFY(!device.isConnected());
    QVERIFY(!device.address().has_value());

    device.setConnected("tcp://10.0.0.2:22000");
    QVERIFY(device.isConnected());
    QCOMPARE(QString::fromStdString(device.address().value()), QStringLiteral("tcp://10.0.0.2:22000"));

    device.setDisconnected();
    QVERIFY(!device.isConnected());
}

void DomainRegistryTests::testIgnoreMatching()
{
    const syncwarden::FolderIgnores ignores({"*.tmp", "(broken"},
                                            {"(?i)^.*\\.tmp$", "(broken", "^node_modules(/.*)?$"});
    QCOMPARE(ignores.ignorePatterns().size(), static_cast<size_t>(2));
    QCOMPARE(ignores.regexPatterns().size(), static_cast<size_t>(3));
    QVERIFY(ignores.isIgnored("cache/FILE.TMP"));
    QVERIFY(ignores.isIgnored("node_modules/lib/index.js"));
    QVERIFY(!ignores.isIgnored("src/main.cpp"));

    syncwarden::Folder folder("default", "/sync", syncwarden::FolderIgnores());
    QVERIFY(!folder.ignores().isIgnored("x.tmp"));
    folder.setIgnores(ignores);
    QVERIFY(folder.ignores().isIgnored("x.tmp"));
}

QTEST_MAIN(DomainRegistryTests)
#include "test_domain_registry.moc"
