#ifndef MOLPROP_LIBRARY_H
#define MOLPROP_LIBRARY_H

#include "../src/loss/loss.hpp"
#include "../src/loss/registry.hpp"
#include "../src/loss/report.hpp"
#include "../src/common/save_load.hpp"
#include "../src/utils/terminal.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Molprop::Loss::select resolves (dataset type, loss name) to a descriptor once at setup.
//  - Molprop::Loss::compute evaluates that descriptor on a batch and returns the unreduced,
//    per-element loss. Reduction and backward are left to the training loop.
//  - Molprop::Common::SaveLoad reads the loss section of a JSON run configuration.
//  - Header-only; every module lives under src/.

#endif // MOLPROP_LIBRARY_H
