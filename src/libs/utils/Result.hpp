// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Utils {

// Outcome of a batch operation. Failures are collected, not thrown: one bad
// item never stops the others, and each failure names the item it is about.
class Result final
{
public:
    struct Failure final {
        QString subject; // key, file or setting; empty when not item specific
        QString message;
    };

    static Result success() { return Result{}; }

    static Result failure(const QString& message, const QString& subject = {})
    {
        Result r;
        r.addError(message, subject);
        return r;
    }

    void addError(const QString& message, const QString& subject = {})
    {
        m_failures.push_back(Failure{subject, message});
    }

    void merge(const Result& other) { m_failures.append(other.m_failures); }

    bool ok() const { return m_failures.isEmpty(); }
    qsizetype errorCount() const { return m_failures.size(); }
    const QList<Failure>& failures() const { return m_failures; }

    // Subjects in failure order, without duplicates or empties.
    QStringList failedSubjects() const
    {
        QStringList subjects;
        for (const Failure& f : m_failures) {
            if (!f.subject.isEmpty() && !subjects.contains(f.subject))
                subjects.push_back(f.subject);
        }
        return subjects;
    }

    QString message() const
    {
        QStringList parts;
        for (const Failure& f : m_failures)
            parts.push_back(f.message);
        return parts.join(QStringLiteral("; "));
    }

    explicit operator bool() const { return ok(); }

private:
    QList<Failure> m_failures;
};

} // namespace Utils
