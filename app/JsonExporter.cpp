#include "JsonExporter.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <stdexcept>

namespace net_survey::app
{
    namespace
    {
        QJsonValue OrNull(const std::optional<std::string> &value)
        {
            return value ? QJsonValue(QString::fromStdString(*value)) : QJsonValue(QJsonValue::Null);
        }

        template <typename T>
        QJsonValue OrNull(const std::optional<T> &value)
        {
            return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
        }
    }

    QJsonObject DeviceToJson(const scanner::Device &device)
    {
        QJsonObject obj;
        obj["ip"] = QString::fromStdString(device.ip);
        obj["mac"] = OrNull(device.mac);
        obj["vendor"] = OrNull(device.vendor);
        obj["hostname"] = OrNull(device.hostname);
        obj["is_gateway"] = device.is_gateway;
        obj["alive"] = OrNull(device.alive);
        obj["rtt_ms"] = OrNull(device.rtt_ms);
        obj["first_seen"] = QString::fromStdString(device.first_seen);
        obj["last_seen"] = QString::fromStdString(device.last_seen);
        return obj;
    }

    QJsonObject ScanResultToJson(const scanner::ScanResult &result)
    {
        QJsonArray devices;
        for (const auto &device : result.devices)
            devices.append(DeviceToJson(device));

        QJsonObject obj;
        obj["subnet"] = QString::fromStdString(result.subnet);
        obj["gateway_ip"] = OrNull(result.gateway_ip);
        obj["started_at"] = QString::fromStdString(result.started_at);
        obj["finished_at"] = QString::fromStdString(result.finished_at);
        obj["devices"] = devices;
        return obj;
    }

    void SaveJson(const scanner::ScanResult &result, const std::string &path)
    {
        QFile file(QString::fromStdString(path));
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
            throw std::runtime_error("Cannot write " + path + ": " + file.errorString().toStdString());

        QByteArray bytes = QJsonDocument(ScanResultToJson(result)).toJson(QJsonDocument::Indented);
        if (file.write(bytes) != bytes.size())
            throw std::runtime_error("Short write to " + path);
    }
}
