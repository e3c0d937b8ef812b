#pragma once

#include <QString>

class CancellationToken;

class HostEnvironment
{
public:
    virtual ~HostEnvironment() = default;

    // Empty when the variable is unset.
    virtual QString value(const QString &name) const = 0;
    virtual QString baseDirectory() const = 0;
    virtual QString currentDirectory() const = 0;

    virtual bool isFunctionHost() const = 0;
    virtual bool isAppServiceHost() const = 0;
    virtual bool isCiRunner() const = 0;
    virtual bool isContainer(const CancellationToken &token) const = 0;
};

class SystemHostEnvironment : public HostEnvironment
{
public:
    // rootPath is the filesystem root used for container marker files.
    explicit SystemHostEnvironment(const QString &rootPath = QStringLiteral("/"));

    QString value(const QString &name) const override;
    QString baseDirectory() const override;
    QString currentDirectory() const override;

    bool isFunctionHost() const override;
    bool isAppServiceHost() const override;
    bool isCiRunner() const override;
    bool isContainer(const CancellationToken &token) const override;

private:
    bool isTrueValue(const QString &name) const;
    bool cgroupMentionsContainer(const CancellationToken &token) const;

    QString rootPath_;
};
