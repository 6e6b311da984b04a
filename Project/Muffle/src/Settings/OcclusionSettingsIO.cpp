#include "pch.h"
#include "Settings/OcclusionSettingsIO.hpp"
#include "Sound/Occlusion/OcclusionErrors.hpp"
#include "Logging.hpp"

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

namespace {
    // Reads an optional numeric member; a present member of the wrong type is an error
    bool ReadFloat(const rapidjson::Value& obj, const char* name, float& out) {
        if (!obj.HasMember(name)) {
            return false;
        }
        const rapidjson::Value& v = obj[name];
        if (!v.IsNumber()) {
            throw ConfigurationError(std::string("'") + name + "' must be a number");
        }
        out = v.GetFloat();
        return true;
    }

    std::shared_ptr<KeyframeCurve> ReadCurve(const rapidjson::Value& curveValue) {
        if (!curveValue.IsObject() || !curveValue.HasMember("keys") || !curveValue["keys"].IsArray()) {
            throw ConfigurationError("'falloffCurve' must be an object with a 'keys' array");
        }

        auto curve = std::make_shared<KeyframeCurve>();
        for (const auto& keyValue : curveValue["keys"].GetArray()) {
            if (!keyValue.IsObject()) {
                throw ConfigurationError("'falloffCurve.keys' entries must be objects");
            }

            CurveKeyframe key;
            if (!ReadFloat(keyValue, "time", key.time) || !ReadFloat(keyValue, "value", key.value)) {
                throw ConfigurationError("curve keys need numeric 'time' and 'value'");
            }

            if (keyValue.HasMember("interpolation")) {
                const rapidjson::Value& interp = keyValue["interpolation"];
                if (!interp.IsString() || !CurveInterpolationFromString(interp.GetString(), key.interpolation)) {
                    throw ConfigurationError("'interpolation' must be one of linear, smooth, constant");
                }
            }
            curve->AddKey(key);
        }
        return curve;
    }
}

OcclusionSettings OcclusionSettingsIO::FromJson(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError()) {
        std::string message = std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset())
            + ": " + rapidjson::GetParseError_En(doc.GetParseError());
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] ", message);
        throw ConfigurationError(message);
    }
    if (!doc.IsObject()) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] Root is not an object");
        throw ConfigurationError("occlusion settings root must be a JSON object");
    }

    OcclusionSettings settings;
    try {
        ReadFloat(doc, "maximumRange", settings.maximumRange);
        ReadFloat(doc, "dampenThreshold", settings.dampenThreshold);
        ReadFloat(doc, "smoothingRate", settings.smoothingRate);
        ReadFloat(doc, "reverbThreshold", settings.reverbThreshold);

        if (doc.HasMember("falloffCurve")) {
            settings.falloffCurve = ReadCurve(doc["falloffCurve"]);
        }
    }
    catch (const ConfigurationError& e) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] ", e.what());
        throw;
    }

    settings.Validate();
    return settings;
}

std::string OcclusionSettingsIO::ToJson(const OcclusionSettings& settings) {
    auto curve = std::dynamic_pointer_cast<const KeyframeCurve>(settings.falloffCurve);
    if (!curve) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] Only keyframe curves can be serialized");
        throw ConfigurationError("falloffCurve is not a KeyframeCurve and cannot be serialized");
    }

    rapidjson::Document doc;
    doc.SetObject();
    rapidjson::Document::AllocatorType& alloc = doc.GetAllocator();

    doc.AddMember("maximumRange", settings.maximumRange, alloc);
    doc.AddMember("dampenThreshold", settings.dampenThreshold, alloc);
    doc.AddMember("smoothingRate", settings.smoothingRate, alloc);
    doc.AddMember("reverbThreshold", settings.reverbThreshold, alloc);

    rapidjson::Value keys(rapidjson::kArrayType);
    for (const CurveKeyframe& key : curve->GetKeys()) {
        rapidjson::Value keyValue(rapidjson::kObjectType);
        keyValue.AddMember("time", key.time, alloc);
        keyValue.AddMember("value", key.value, alloc);
        keyValue.AddMember("interpolation", rapidjson::StringRef(CurveInterpolationToString(key.interpolation)), alloc);
        keys.PushBack(keyValue, alloc);
    }

    rapidjson::Value curveValue(rapidjson::kObjectType);
    curveValue.AddMember("keys", keys, alloc);
    doc.AddMember("falloffCurve", curveValue, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

bool OcclusionSettingsIO::LoadSettings(const std::string& filePath, OcclusionSettings& out) {
    namespace fs = std::filesystem;

    if (!fs::exists(filePath)) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Warn, "[OcclusionSettingsIO] No settings file at: ", filePath);
        return false;
    }

    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile.is_open()) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] Failed to open file: ", filePath);
        return false;
    }

    std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
    inFile.close();

    try {
        out = FromJson(jsonContent);
    }
    catch (const ConfigurationError& e) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] Rejected ", filePath, ": ", e.what());
        return false;
    }

    MUFFLE_PRINT(MuffleLogging::LogLevel::Info, "[OcclusionSettingsIO] Loaded settings from: ", filePath);
    return true;
}

bool OcclusionSettingsIO::SaveSettings(const std::string& filePath, const OcclusionSettings& settings) {
    namespace fs = std::filesystem;

    std::string json;
    try {
        json = ToJson(settings);
    }
    catch (const ConfigurationError& e) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] Cannot save ", filePath, ": ", e.what());
        return false;
    }

    // Create parent directory if needed
    fs::path parentDir = fs::path(filePath).parent_path();
    if (!parentDir.empty() && !fs::exists(parentDir)) {
        std::error_code ec;
        fs::create_directories(parentDir, ec);
        if (ec) {
            MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] Failed to create directory: ", parentDir.string());
            return false;
        }
    }

    std::ofstream outFile(filePath, std::ios::binary);
    if (!outFile.is_open()) {
        MUFFLE_PRINT(MuffleLogging::LogLevel::Error, "[OcclusionSettingsIO] Failed to open file for writing: ", filePath);
        return false;
    }

    outFile << json;
    outFile.close();

    MUFFLE_PRINT(MuffleLogging::LogLevel::Debug, "[OcclusionSettingsIO] Saved settings to: ", filePath);
    return true;
}
