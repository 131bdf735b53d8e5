#pragma once
#include <stdexcept>
#include <string>

namespace faculty {

class FacultySimError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// missing/malformed request fields, vector dimension mismatch, bad CLI values
class InputValidationError : public FacultySimError {
public:
    using FacultySimError::FacultySimError;
};

class ModelInitializationError : public FacultySimError {
public:
    using FacultySimError::FacultySimError;
};

class EmbeddingGenerationError : public FacultySimError {
public:
    using FacultySimError::FacultySimError;
};

// guard failure or any numerical primitive faulting
class ClusteringError : public FacultySimError {
public:
    using FacultySimError::FacultySimError;
};

class TopicAnalysisError : public FacultySimError {
public:
    using FacultySimError::FacultySimError;
};

}  // namespace faculty
