#include "../include/errors.hpp"
#include "../../../shared/cpp/agent_sdk/include/inference_client.hpp"

const char* to_string(ErrorClass c) {
    switch (c) {
        case ErrorClass::Configuration: return "configuration";
        case ErrorClass::TransientInference: return "transient_inference";
        case ErrorClass::PermanentInference: return "permanent_inference";
        case ErrorClass::DependencyUnmet: return "dependency_unmet";
        case ErrorClass::Aggregation: return "aggregation";
        case ErrorClass::InputUnavailable: return "input_unavailable";
        case ErrorClass::Cancelled: return "cancelled";
    }
    return "unknown";
}

ClassifiedError classify(std::exception_ptr ep) {
    if (!ep) return {ErrorClass::PermanentInference, "unknown error"};
    try {
        std::rethrow_exception(ep);
    } catch (const InferenceError& e) {
        return {e.transient() ? ErrorClass::TransientInference : ErrorClass::PermanentInference, e.what()};
    } catch (const CancelledError& e) {
        return {ErrorClass::Cancelled, e.what()};
    } catch (const InputUnavailableError& e) {
        return {ErrorClass::InputUnavailable, e.what()};
    } catch (const ConfigurationError& e) {
        return {ErrorClass::Configuration, e.what()};
    } catch (const std::exception& e) {
        return {ErrorClass::PermanentInference, e.what()};
    } catch (...) {
        return {ErrorClass::PermanentInference, "non-standard exception"};
    }
}
