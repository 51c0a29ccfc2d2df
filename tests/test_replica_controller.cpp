#include <iostream>
#include <string>
#include <json/json.h>
#include "../src/Log.hpp"
#include "../src/ReplicaController.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static Json::Value call(ReplicaController& controller, int id, const std::string& method, const Json::Value& params) {
    Json::Value request;
    request["id"] = id;
    request["method"] = method;
    request["params"] = params;
    return controller.handleRequest(request);
}

int main() {
    setLogLevel(LogLevel::Off);
    try {
        ReplicaController controller;

        Json::Value addColl;
        addColl["collectionID"] = (Json::Int64)1;
        addColl["schema"]["name"] = "coll1";
        Json::Value res = call(controller, 1, "addCollection", addColl);
        ASSERT_TRUE(!res.isMember("error"));
        ASSERT_TRUE(res["jsonrpc"].asString() == "2.0");
        ASSERT_TRUE(res["id"].asInt() == 1);

        res = call(controller, 2, "getCollectionNum", Json::Value(Json::objectValue));
        ASSERT_TRUE(res["result"]["count"].asInt() == 1);

        Json::Value byName;
        byName["name"] = "coll1";
        res = call(controller, 3, "getCollectionIDByName", byName);
        ASSERT_TRUE(res["result"]["collectionID"].asInt64() == 1);
        res = call(controller, 4, "getCollectionByName", byName);
        ASSERT_TRUE(res["result"]["schema"]["name"].asString() == "coll1");

        Json::Value addSeg;
        addSeg["segmentID"] = (Json::Int64)5;
        addSeg["collectionID"] = (Json::Int64)1;
        addSeg["partitionID"] = (Json::Int64)0;
        addSeg["createTime"] = (Json::UInt64)1000;
        addSeg["startPositions"][0]["channelName"] = "insert-0";
        addSeg["startPositions"][0]["msgID"] = "m0";
        addSeg["startPositions"][0]["timestamp"] = (Json::UInt64)999;
        res = call(controller, 5, "addSegment", addSeg);
        ASSERT_TRUE(!res.isMember("error"));
        ASSERT_TRUE(controller.replica().hasSegment(5));

        Json::Value update;
        update["segmentID"] = (Json::Int64)5;
        update["numRows"] = (Json::Int64)10;
        update["endTime"] = (Json::UInt64)1001;
        update["endPositions"][0]["channelName"] = "insert-0";
        update["endPositions"][0]["msgID"] = "m1";
        update["endPositions"][0]["timestamp"] = (Json::UInt64)1001;
        res = call(controller, 6, "updateStatistics", update);
        ASSERT_TRUE(!res.isMember("error"));

        Json::Value segParams;
        segParams["segmentID"] = (Json::Int64)5;
        res = call(controller, 7, "getSegmentStatisticsUpdates", segParams);
        ASSERT_TRUE(res["result"]["isNewSegment"].asBool());
        ASSERT_TRUE(res["result"]["numRows"].asInt64() == 10);
        ASSERT_TRUE(res["result"]["startPositions"][0]["msgID"].asString() == "m0");
        ASSERT_TRUE(res["result"]["endPositions"][0]["msgID"].asString() == "m1");
        res = call(controller, 8, "getSegmentStatisticsUpdates", segParams);
        ASSERT_TRUE(!res["result"]["isNewSegment"].asBool());

        res = call(controller, 9, "getSegmentByID", segParams);
        ASSERT_TRUE(res["result"]["collectionID"].asInt64() == 1);
        ASSERT_TRUE(res["result"]["isNew"].asBool() == false);

        res = call(controller, 10, "listSegments", Json::Value(Json::objectValue));
        ASSERT_TRUE(res["result"]["segmentIDs"].size() == 1);

        // Error mapping
        Json::Value missing;
        missing["segmentID"] = (Json::Int64)6;
        res = call(controller, 11, "removeSegment", missing);
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kNotFound);
        res = call(controller, 12, "getSegmentByID", missing);
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kNotFound);

        Json::Value missingColl;
        missingColl["collectionID"] = (Json::Int64)7;
        res = call(controller, 13, "removeCollection", missingColl);
        ASSERT_TRUE(!res.isMember("error"));
        res = call(controller, 14, "getCollectionByID", missingColl);
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kNotFound);

        Json::Value badParams;
        badParams["segmentID"] = "five";
        res = call(controller, 15, "hasSegment", badParams);
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kInvalidParams);

        Json::Value negative = update;
        negative["numRows"] = (Json::Int64)-3;
        res = call(controller, 16, "updateStatistics", negative);
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kInvalidParams);

        res = call(controller, 17, "flushSegment", segParams);
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kMethodNotFound);

        res = controller.handleLine(R"({"id": 21, "method": {"x": 1}, "params": {}})");
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kInvalidParams);
        ASSERT_TRUE(res["id"].asInt() == 21);
        res = controller.handleLine(R"({"id": 22, "method": ["hasSegment"], "params": {}})");
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kInvalidParams);

        res = controller.handleLine("{broken");
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kParseError);

        res = controller.handleLine(R"({"id": 18, "method": "hasSegment", "params": {"segmentID": 5}})");
        ASSERT_TRUE(res["result"]["exists"].asBool());

        // Duplicates under the reject policy
        ReplicaConfig config;
        config.duplicatePolicy = DuplicatePolicy::Reject;
        ReplicaController strict(config);
        ASSERT_TRUE(!call(strict, 1, "addSegment", addSeg).isMember("error"));
        res = call(strict, 2, "addSegment", addSeg);
        ASSERT_TRUE(res["error"]["code"].asInt() == ReplicaController::kDuplicateId);

        res = call(controller, 19, "getAllSegmentStatisticsUpdates", Json::Value(Json::objectValue));
        ASSERT_TRUE(res["result"]["updates"].size() == 1);

        res = call(controller, 20, "removeSegment", segParams);
        ASSERT_TRUE(!res.isMember("error"));
        ASSERT_TRUE(controller.replica().getSegmentNum() == 0);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All replica controller tests passed" << std::endl;
    return 0;
}
