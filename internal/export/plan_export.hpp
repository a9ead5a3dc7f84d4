#pragma once

#include <string>
#include <vector>

#include "internal/batch/batch_planner.hpp"
#include "internal/model/render_graph.hpp"
#include "internal/plan/output_planner.hpp"
#include "renderplan/v1.hpp"

namespace renderplan::exporter {

renderplan::v1::RenderGraph ToProto(const model::RenderGraph& graph);
renderplan::v1::PassPlan    ToProto(const plan::PassPlan& pass_plan);

renderplan::v1::OutputPlan ToOutputPlan(const std::string& source,
                                        const std::string& frames,
                                        const std::vector<plan::PassPlan>& passes);

renderplan::v1::BatchReport ToBatchReport(const std::string& batch_name,
                                          const std::vector<batch::BatchItemResult>& results);

// Pretty printed JSON with proto field names. Throws std::runtime_error
// if protobuf refuses the message.
std::string ToJson(const google::protobuf::Message& message);

} // namespace renderplan::exporter
