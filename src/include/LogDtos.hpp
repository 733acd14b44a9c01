#pragma once
#include <QString>
#include <QDateTime>

// Operator log row (system_logs table)
struct SystemLog {
    int id{};
    int level{};        // 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;
};
