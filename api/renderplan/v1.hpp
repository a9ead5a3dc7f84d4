#pragma once

#include "renderplan/v1/plan.pb.h"

namespace renderplan::v1 {

/*
  Wire/JSON shapes for graphs and plans. The in-memory types live in
  internal/model and internal/plan; internal/export converts between them.
*/

} // namespace renderplan::v1
