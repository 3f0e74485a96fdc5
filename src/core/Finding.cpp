#include "Finding.h"

namespace secret_hunter {

const char* kind_label(FindingKind kind) {
    switch(kind) {
        case FindingKind::Email: return "EMAIL";
        case FindingKind::Password: return "PASSWORD";
        case FindingKind::ApiKey: return "API KEY";
    }
    return "UNKNOWN";
}

const char* kind_id(FindingKind kind) {
    switch(kind) {
        case FindingKind::Email: return "email";
        case FindingKind::Password: return "password";
        case FindingKind::ApiKey: return "api_key";
    }
    return "unknown";
}

const char* kind_severity(FindingKind kind) {
    switch(kind) {
        case FindingKind::Email: return "low";
        case FindingKind::Password: return "high";
        case FindingKind::ApiKey: return "high";
    }
    return "info";
}

}
