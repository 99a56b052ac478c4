//  converge
//  Declarative integration reconciliation
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the converge authors
#pragma once

#include "converge/error.hh"
#include "converge/node.hh"
#include "converge/types.hh"
#include "converge/fingerprint.hh"
#include "converge/planner.hh"
#include "converge/state_store.hh"
#include "converge/stepper.hh"
#include "converge/keyed_mutex.hh"
#include "converge/reconciler.hh"
#include "converge/document.hh"
#include "converge/command_stepper.hh"
#include "converge/report.hh"
