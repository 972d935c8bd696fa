#pragma once

#include "core/backup_orchestrator.hpp"
#include "core/command_executor.hpp"
#include "core/config.hpp"
#include "core/connectivity_probe.hpp"
#include "core/device_installer.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/reset_lifecycle.hpp"
#include "core/session_manager.hpp"
#include "core/transfer_engine.hpp"
#include "protocols/local_file_system.hpp"
