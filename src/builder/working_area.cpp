#include "builder/working_area.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>

#include <utility>

#include "common/build_error.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace snapforge {

namespace {

constexpr const char *kArchiveName = "image.tar";
constexpr const char *kFilesystemArchiveName = "image.gnutar";
constexpr const char *kBlockImageName = "image.ext2";
constexpr const char *kSnapshotName = "image";
constexpr const char *kHashFileName = "hash";
constexpr qint64 kHashSizeBytes = 32;

} // namespace

WorkingArea::WorkingArea(QString root)
    : m_root(QFileInfo(root).absoluteFilePath())
{
}

WorkingArea::~WorkingArea()
{
    removeIntermediates();
    if (!m_snapshotCommitted) {
        discardSnapshot();
    }
}

QString WorkingArea::lockFilePath() const
{
    return m_root + QStringLiteral(".lock");
}

void WorkingArea::acquire()
{
    const QString parent = QFileInfo(m_root).absolutePath();
    if (!QDir().mkpath(parent)) {
        throw BuildError(BuildErrorKind::WorkingAreaUnavailable,
                         "could not create parent directory " + parent.toStdString()
                             + " of working area " + m_root.toStdString());
    }

    auto lock = std::make_unique<QLockFile>(lockFilePath());
    lock->setStaleLockTime(0);
    if (!lock->tryLock(0)) {
        if (lock->error() == QLockFile::LockFailedError) {
            throw BuildError(BuildErrorKind::WorkingAreaLocked,
                             "working area " + m_root.toStdString()
                                 + " is in use by another build (lock "
                                 + lockFilePath().toStdString() + ")");
        }
        throw BuildError(BuildErrorKind::WorkingAreaUnavailable,
                         "could not create lock file " + lockFilePath().toStdString()
                             + " for working area " + m_root.toStdString());
    }
    m_lock = std::move(lock);
}

void WorkingArea::reset()
{
    QDir dir(m_root);
    if (dir.exists()) {
        const QString foreign = firstForeignEntry();
        if (!foreign.isEmpty()) {
            throw BuildError(BuildErrorKind::WorkingAreaUnavailable,
                             "refusing to empty " + m_root.toStdString()
                                 + ": it contains " + foreign.toStdString()
                                 + ", which no build produces");
        }
        SFLOG_INFO(QStringLiteral("WorkingArea"),
                   QStringLiteral("reset"),
                   QStringLiteral("working_area_reset"),
                   QStringLiteral("build_start"),
                   QStringLiteral("remove_recursively"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_root.toStdString()}}));
    }
    if (dir.exists() && !dir.removeRecursively()) {
        throw BuildError(BuildErrorKind::WorkingAreaUnavailable,
                         "could not empty working area " + m_root.toStdString());
    }
    if (!QDir().mkpath(m_root)) {
        throw BuildError(BuildErrorKind::WorkingAreaUnavailable,
                         "could not create working area " + m_root.toStdString());
    }
    m_prepared = true;
}

void WorkingArea::commitSnapshot()
{
    const QString snapshot = path(kSnapshotName);
    if (!QFileInfo::exists(snapshot)) {
        throw BuildError(BuildErrorKind::ArtifactCopyFailed,
                         "snapshot missing at " + snapshot.toStdString());
    }

    const QFileDevice::Permissions mode = QFileDevice::ReadOwner | QFileDevice::WriteOwner
        | QFileDevice::ExeOwner | QFileDevice::ReadGroup | QFileDevice::ExeGroup
        | QFileDevice::ReadOther | QFileDevice::ExeOther;
    if (!QFile::setPermissions(snapshot, mode)) {
        throw BuildError(BuildErrorKind::WorkingAreaUnavailable,
                         "could not mark snapshot executable: " + snapshot.toStdString());
    }
    m_snapshotCommitted = true;
}

void WorkingArea::removeIntermediates()
{
    if (!m_lock || !m_prepared) {
        return;
    }
    removePath(path(kArchiveName));
    removePath(path(kFilesystemArchiveName));
    removePath(path(kBlockImageName));
}

void WorkingArea::discardSnapshot()
{
    m_snapshotCommitted = false;
    if (!m_lock || !m_prepared) {
        return;
    }
    removePath(path(kSnapshotName));
}

std::string WorkingArea::archivePath() const
{
    return path(kArchiveName).toStdString();
}

std::string WorkingArea::filesystemArchivePath() const
{
    return path(kFilesystemArchiveName).toStdString();
}

std::string WorkingArea::blockImagePath() const
{
    return path(kBlockImageName).toStdString();
}

std::string WorkingArea::snapshotPath() const
{
    return path(kSnapshotName).toStdString();
}

QString WorkingArea::firstForeignEntry() const
{
    const QStringList known = {QString::fromLatin1(kArchiveName),
                               QString::fromLatin1(kFilesystemArchiveName),
                               QString::fromLatin1(kBlockImageName),
                               QString::fromLatin1(kSnapshotName)};
    const QStringList entries = QDir(m_root).entryList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);
    for (const QString &entry : entries) {
        if (!known.contains(entry)) {
            return entry;
        }
    }
    return {};
}

QString WorkingArea::path(const char *name) const
{
    return m_root + QLatin1Char('/') + QString::fromLatin1(name);
}

void WorkingArea::removePath(const QString &target)
{
    const QFileInfo info(target);
    if (!info.exists() && !info.isSymLink()) {
        return;
    }

    const bool removed = info.isDir() && !info.isSymLink()
        ? QDir(target).removeRecursively()
        : QFile::remove(target);
    if (!removed) {
        SFLOG_WARN(QStringLiteral("WorkingArea"),
                   QStringLiteral("removePath"),
                   QStringLiteral("artifact_remove_failed"),
                   QStringLiteral("cleanup"),
                   QStringLiteral("filesystem"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", target.toStdString()}}));
    }
}

std::optional<std::string> readSnapshotHash(const std::string &snapshotPath)
{
    QFile file(QString::fromStdString(snapshotPath) + QLatin1Char('/')
               + QString::fromLatin1(kHashFileName));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    const QByteArray hash = file.readAll();
    if (hash.size() != kHashSizeBytes) {
        return std::nullopt;
    }
    return "0x" + hash.toHex().toStdString();
}

} // namespace snapforge
