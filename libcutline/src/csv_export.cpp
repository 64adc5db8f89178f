#include "cutline/csv_export.hpp"

#include "cutline/common.hpp"

#include <QFile>
#include <QLocale>
#include <QTextStream>
#include <QDebug>

namespace cutline {

namespace {

QString quoted(const QString &field)
{
    QString safe = field;
    safe.replace(QLatin1Char('"'), QStringLiteral("\"\""));
    return QLatin1Char('"') + safe + QLatin1Char('"');
}

} // namespace

QString eventsToCsv(const std::vector<DetectionEvent> &events)
{
    QStringList lines;
    lines.reserve(static_cast<int>(events.size()) + 1);
    lines << QStringLiteral("time,size,confidence,source,id");

    for (const DetectionEvent &ev : events) {
        const QStringList fields = {
            quoted(formatHms(ev.timeOffset)),
            quoted(categoryToString(ev.size)),
            quoted(QString::number(ev.confidence, 'g', QLocale::FloatingPointShortest)),
            quoted(ev.source),
            quoted(ev.id),
        };
        lines << fields.join(QLatin1Char(','));
    }

    return lines.join(QLatin1Char('\n'));
}

bool exportToCsv(const QString &filePath, const std::vector<DetectionEvent> &events)
{
    QFile f(filePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "CsvExporter: cannot open" << filePath << "-" << f.errorString();
        return false;
    }

    QTextStream out(&f);
    out << eventsToCsv(events);
    out.flush();

    if (out.status() != QTextStream::Ok) {
        qWarning() << "CsvExporter: write to" << filePath << "failed";
        return false;
    }

    return true;
}

std::vector<QStringList> parseCsv(const QString &text)
{
    std::vector<QStringList> rows;
    if (text.isEmpty()) {
        return rows;
    }

    QStringList row;
    QString field;
    bool inQuotes = false;
    bool rowOpen = false;

    const int n = text.size();
    for (int i = 0; i < n; ++i) {
        const QChar c = text.at(i);
        rowOpen = true;

        if (inQuotes) {
            if (c == QLatin1Char('"')) {
                if (i + 1 < n && text.at(i + 1) == QLatin1Char('"')) {
                    field += QLatin1Char('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == QLatin1Char('"')) {
            inQuotes = true;
        } else if (c == QLatin1Char(',')) {
            row << field;
            field.clear();
        } else if (c == QLatin1Char('\r') && i + 1 < n && text.at(i + 1) == QLatin1Char('\n')) {
            // folded into the following '\n'
        } else if (c == QLatin1Char('\n')) {
            row << field;
            field.clear();
            rows.push_back(row);
            row.clear();
            rowOpen = false;
        } else {
            field += c;
        }
    }

    // Last record has no terminator
    if (rowOpen) {
        row << field;
        rows.push_back(row);
    }

    return rows;
}

} // namespace cutline
