#pragma once

#include <memory>
#include <optional>
#include <string>

#include <QString>

class QLockFile;

namespace snapforge {

/**
 * WorkingArea owns the directory a single build writes into:
 * - image.tar     portable image archive (stage 1 output)
 * - image.gnutar  root filesystem archive (stage 2 output)
 * - image.ext2    filesystem image (stage 3 output)
 * - image/        machine snapshot (final artifact)
 *
 * Intermediates are removed when the object is destroyed; the snapshot is
 * removed too unless commitSnapshot() succeeded. A lock file next to the
 * directory keeps concurrent builds out.
 */
class WorkingArea
{
public:
    explicit WorkingArea(QString root);
    ~WorkingArea();

    WorkingArea(const WorkingArea &) = delete;
    WorkingArea &operator=(const WorkingArea &) = delete;

    // Throws BuildError(WorkingAreaLocked) if another build holds the lock,
    // BuildError(WorkingAreaUnavailable) if the lock file cannot be created.
    void acquire();

    // Empties and recreates the directory. An existing directory holding
    // anything but the artifacts listed above is left untouched.
    // Throws BuildError(WorkingAreaUnavailable).
    void reset();

    // Marks the snapshot directory 0755 and keeps it past destruction.
    void commitSnapshot();

    // Only act while the lock is held and after reset() succeeded. Missing
    // files are not an error; failures to delete are logged.
    void removeIntermediates();
    void discardSnapshot();

    bool isAcquired() const { return m_lock != nullptr; }
    QString root() const { return m_root; }
    QString lockFilePath() const;
    std::string archivePath() const;
    std::string filesystemArchivePath() const;
    std::string blockImagePath() const;
    std::string snapshotPath() const;

private:
    QString path(const char *name) const;
    // Name of the first entry under the root that is not a build artifact.
    QString firstForeignEntry() const;
    static void removePath(const QString &path);

    QString m_root;
    std::unique_ptr<QLockFile> m_lock;
    bool m_prepared = false;
    bool m_snapshotCommitted = false;
};

// Root hash stored by the snapshot tool in <snapshot>/hash, as 0x-prefixed hex.
std::optional<std::string> readSnapshotHash(const std::string &snapshotPath);

} // namespace snapforge
