#pragma once

#include <QMetaType>

namespace syncwarden {

enum class SupervisorState {
    Stopped,
    Starting,
    Running,
    Stopping,
    Restarting
};

enum class ExitStatus {
    Normal,
    Error
};

enum class FolderSyncState {
    Idle,
    Scanning,
    Syncing,
    Error,
    Unknown
};

} // namespace syncwarden

Q_DECLARE_METATYPE(syncwarden::SupervisorState)
Q_DECLARE_METATYPE(syncwarden::ExitStatus)
Q_DECLARE_METATYPE(syncwarden::FolderSyncState)
