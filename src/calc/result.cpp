// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "result.hpp"

#include <stdexcept>

namespace obscalc::calc {

namespace {

json signalToNoiseToJson(const SignalToNoiseAt& sn) {
    return {{"wavelength", sn.wavelengthPm},
            {"single", sn.single},
            {"total", sn.total}};
}

SignalToNoiseAt signalToNoiseFromJson(const json& j) {
    SignalToNoiseAt sn;
    sn.wavelengthPm = j.at("wavelength").get<int64_t>();
    sn.single = j.at("single").get<double>();
    sn.total = j.at("total").get<double>();
    return sn;
}

json targetResultToJson(const TargetResult& r) {
    json j;
    j["targetId"] = r.targetId;
    j["exposureTime"] = r.exposureTimeMicros;
    j["exposureCount"] = r.exposureCount;
    if (r.signalToNoise) {
        j["signalToNoise"] = signalToNoiseToJson(*r.signalToNoise);
    }
    return j;
}

TargetResult targetResultFromJson(const json& j) {
    TargetResult r;
    r.targetId = j.at("targetId").get<std::string>();
    r.exposureTimeMicros = j.at("exposureTime").get<int64_t>();
    r.exposureCount = j.at("exposureCount").get<int>();
    if (j.contains("signalToNoise") && !j["signalToNoise"].is_null()) {
        r.signalToNoise = signalToNoiseFromJson(j["signalToNoise"]);
    }
    return r;
}

json sequenceDigestToJson(const SequenceDigest& d) {
    return {{"observeClass", d.observeClass},
            {"nonChargedTime", d.nonChargedTimeMicros},
            {"programTime", d.programTimeMicros},
            {"atomCount", d.atomCount},
            {"executionState", d.executionState}};
}

SequenceDigest sequenceDigestFromJson(const json& j) {
    SequenceDigest d;
    d.observeClass = j.value("observeClass", d.observeClass);
    d.nonChargedTimeMicros = j.value("nonChargedTime", int64_t{0});
    d.programTimeMicros = j.value("programTime", int64_t{0});
    d.atomCount = j.value("atomCount", 0);
    d.executionState = j.value("executionState", d.executionState);
    return d;
}

WorkflowState workflowStateFromJson(const json& j) {
    auto name = j.get<std::string>();
    auto state = workflowStateFromString(name);
    if (!state) {
        throw std::invalid_argument("Unknown workflow state: " + name);
    }
    return *state;
}

}  // namespace

std::optional<WorkflowState> workflowStateFromString(
    std::string_view str) noexcept {
    if (str == "inactive") return WorkflowState::Inactive;
    if (str == "undefined") return WorkflowState::Undefined;
    if (str == "unapproved") return WorkflowState::Unapproved;
    if (str == "defined") return WorkflowState::Defined;
    if (str == "ready") return WorkflowState::Ready;
    if (str == "ongoing") return WorkflowState::Ongoing;
    if (str == "completed") return WorkflowState::Completed;
    return std::nullopt;
}

json CalcResult::toJson() const {
    json j;

    if (itc) {
        j["itc"] = {{"imaging", targetResultToJson(itc->imaging)},
                    {"spectroscopy", targetResultToJson(itc->spectroscopy)}};
    }

    if (digest) {
        j["digest"] = {
            {"setup",
             {{"full", digest->setup.fullMicros},
              {"reacquisition", digest->setup.reacquisitionMicros}}},
            {"acquisition", sequenceDigestToJson(digest->acquisition)},
            {"science", sequenceDigestToJson(digest->science)}};
    }

    json transitions = json::array();
    for (auto t : workflow.validTransitions) {
        transitions.push_back(std::string(workflowStateToString(t)));
    }
    json validations = json::array();
    for (const auto& v : workflow.validations) {
        validations.push_back({{"code", v.code}, {"messages", v.messages}});
    }
    j["workflow"] = {{"state", std::string(workflowStateToString(workflow.state))},
                     {"validTransitions", transitions},
                     {"validations", validations}};

    if (warning) {
        j["warning"] = *warning;
    }
    return j;
}

CalcResult CalcResult::fromJson(const json& j) {
    CalcResult result;

    if (j.contains("itc") && !j["itc"].is_null()) {
        const auto& itcJson = j["itc"];
        result.itc = ItcResult{targetResultFromJson(itcJson.at("imaging")),
                               targetResultFromJson(itcJson.at("spectroscopy"))};
    }

    if (j.contains("digest") && !j["digest"].is_null()) {
        const auto& d = j["digest"];
        ExecutionDigest digest;
        digest.setup.fullMicros = d.at("setup").value("full", int64_t{0});
        digest.setup.reacquisitionMicros =
            d.at("setup").value("reacquisition", int64_t{0});
        digest.acquisition = sequenceDigestFromJson(d.at("acquisition"));
        digest.science = sequenceDigestFromJson(d.at("science"));
        result.digest = digest;
    }

    if (j.contains("workflow")) {
        const auto& w = j["workflow"];
        result.workflow.state = workflowStateFromJson(w.at("state"));
        result.workflow.validTransitions.clear();
        for (const auto& t : w.value("validTransitions", json::array())) {
            result.workflow.validTransitions.push_back(
                workflowStateFromJson(t));
        }
        for (const auto& v : w.value("validations", json::array())) {
            result.workflow.validations.push_back(
                {v.at("code").get<std::string>(),
                 v.value("messages", std::vector<std::string>{})});
        }
    }

    if (j.contains("warning") && j["warning"].is_string()) {
        result.warning = j["warning"].get<std::string>();
    }
    return result;
}

}  // namespace obscalc::calc
