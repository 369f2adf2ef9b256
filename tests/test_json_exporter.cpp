#include "app/JsonExporter.hpp"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <filesystem>
#include <gtest/gtest.h>

using namespace net_survey;
namespace fs = std::filesystem;

namespace {

scanner::ScanResult SampleResult() {
  scanner::ScanResult result;
  result.subnet = "192.168.1.0/24";
  result.gateway_ip = "192.168.1.1";
  result.started_at = "2024-05-01T10:20:30.000000Z";
  result.finished_at = "2024-05-01T10:20:35.000000Z";

  scanner::Device alive;
  alive.ip = "192.168.1.2";
  alive.mac = "D8:EC:5E:44:55:66";
  alive.vendor = "Acme Corp";
  alive.alive = true;
  alive.rtt_ms = 2.25;
  alive.first_seen = result.started_at;
  alive.last_seen = result.started_at;
  result.devices.push_back(alive);

  scanner::Device quiet;
  quiet.ip = "192.168.1.10";
  quiet.mac = "AA:BB:CC:11:22:33";
  quiet.alive = false;
  quiet.first_seen = result.started_at;
  quiet.last_seen = result.started_at;
  result.devices.push_back(quiet);
  return result;
}

}  // namespace

TEST(JsonExporter, TopLevelShape) {
  QJsonObject obj = app::ScanResultToJson(SampleResult());
  EXPECT_EQ(obj.keys().size(), 5);
  EXPECT_EQ(obj["subnet"].toString().toStdString(), "192.168.1.0/24");
  EXPECT_EQ(obj["gateway_ip"].toString().toStdString(), "192.168.1.1");
  EXPECT_EQ(obj["started_at"].toString().toStdString(), "2024-05-01T10:20:30.000000Z");
  ASSERT_TRUE(obj["devices"].isArray());
  EXPECT_EQ(obj["devices"].toArray().size(), 2);
}

TEST(JsonExporter, AbsentValuesAreNull) {
  QJsonArray devices = app::ScanResultToJson(SampleResult())["devices"].toArray();
  QJsonObject quiet = devices.at(1).toObject();

  EXPECT_EQ(quiet.keys().size(), 9);
  EXPECT_TRUE(quiet["vendor"].isNull());
  EXPECT_TRUE(quiet["hostname"].isNull());
  EXPECT_TRUE(quiet["rtt_ms"].isNull());
  EXPECT_FALSE(quiet.value("alive").toBool(true));
  EXPECT_FALSE(quiet.value("is_gateway").toBool(true));

  QJsonObject alive = devices.at(0).toObject();
  EXPECT_TRUE(alive["alive"].toBool());
  EXPECT_DOUBLE_EQ(alive["rtt_ms"].toDouble(), 2.25);
  EXPECT_EQ(alive["vendor"].toString().toStdString(), "Acme Corp");
}

TEST(JsonExporter, UnknownLivenessIsNull) {
  scanner::Device dev;
  dev.ip = "10.0.0.5";
  QJsonObject obj = app::DeviceToJson(dev);
  EXPECT_TRUE(obj["alive"].isNull());
  EXPECT_TRUE(obj["mac"].isNull());
}

TEST(JsonExporter, NoGatewayIsNull) {
  auto result = SampleResult();
  result.gateway_ip.reset();
  EXPECT_TRUE(app::ScanResultToJson(result)["gateway_ip"].isNull());
}

TEST(JsonExporter, SaveWritesParsableFile) {
  auto dir = fs::temp_directory_path() / "net-survey-tests";
  fs::create_directories(dir);
  auto path = (dir / "devices.json").string();

  app::SaveJson(SampleResult(), path);

  QFile file(QString::fromStdString(path));
  ASSERT_TRUE(file.open(QIODevice::ReadOnly));
  QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
  ASSERT_TRUE(doc.isObject());
  EXPECT_EQ(doc.object()["devices"].toArray().size(), 2);
}

TEST(JsonExporter, UnwritablePathThrows) {
  EXPECT_THROW(app::SaveJson(SampleResult(), "/nonexistent-dir/for/sure/devices.json"), std::runtime_error);
}
