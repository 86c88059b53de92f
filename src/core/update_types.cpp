#include "core/update_types.hpp"

const char* to_string(UpdateState state) {
    switch (state) {
        case UpdateState::Created:             return "Created";
        case UpdateState::CheckingWorkingTree: return "CheckingWorkingTree";
        case UpdateState::BackingUp:           return "BackingUp";
        case UpdateState::Fetching:            return "Fetching";
        case UpdateState::CheckingOut:         return "CheckingOut";
        case UpdateState::SyncingDependencies: return "SyncingDependencies";
        case UpdateState::Completed:           return "Completed";
        case UpdateState::Failed:              return "Failed";
        case UpdateState::Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

const char* to_string(UpdateError error) {
    switch (error) {
        case UpdateError::None:                  return "None";
        case UpdateError::VersionUndetectable:   return "VersionUndetectable";
        case UpdateError::NetworkFailure:        return "NetworkFailure";
        case UpdateError::DirtyWorkingTree:      return "DirtyWorkingTree";
        case UpdateError::BranchNotFound:        return "BranchNotFound";
        case UpdateError::CheckoutConflict:      return "CheckoutConflict";
        case UpdateError::DependencySyncFailure: return "DependencySyncFailure";
        case UpdateError::Timeout:               return "Timeout";
        case UpdateError::Cancelled:             return "Cancelled";
        case UpdateError::BackupFailed:          return "BackupFailed";
        case UpdateError::AlreadyRunning:        return "AlreadyRunning";
    }
    return "Unknown";
}

bool is_terminal(UpdateState state) {
    return state == UpdateState::Completed ||
           state == UpdateState::Failed ||
           state == UpdateState::Cancelled;
}

bool is_fatal(UpdateError error) {
    switch (error) {
        case UpdateError::None:
        case UpdateError::DependencySyncFailure:
        case UpdateError::BackupFailed:
            return false;
        default:
            return true;
    }
}
