#pragma once

#include <shroud/core/column.hpp>
#include <shroud/core/time.hpp>
#include <shroud/crypto/digest.hpp>
#include <shroud/crypto/secure_random.hpp>
#include <shroud/engine/aggregate.hpp>
#include <shroud/engine/anonymizer.hpp>
#include <shroud/engine/config.hpp>
#include <shroud/engine/dispatcher.hpp>
#include <shroud/engine/methods.hpp>
#include <shroud/engine/quality.hpp>
#include <shroud/io/csv.hpp>
#include <shroud/io/dataset_io.hpp>
#include <shroud/io/workbook.hpp>
#include <shroud/job.hpp>
#include <shroud/runtime/table.hpp>
