#pragma once

#include "model/acceptance_message.h"
#include "model/completion_message.h"
#include "model/dto/begin_result_dto.h"
#include "model/dto/chunk_result_dto.h"
#include "model/dto/session_summary_dto.h"
#include "model/feedback.h"
#include "model/header_message.h"
#include "model/receive_state.h"
#include "model/session_status.h"
#include "model/transfer_error.h"
