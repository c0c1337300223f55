#pragma once

#include <chrono>
#include <string>
#include <vector>

struct MetaEvent {
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();
};

// general progress information
struct SimpleEvent : public MetaEvent {
    SimpleEvent(std::string const &label, std::string const &message)
        : MetaEvent{}
        , label{ label }
        , message{ message } { }
    std::string label;
    std::string message;
};

// per-attempt and bookkeeping details, only shown with higher verbosity
struct DetailEvent : public MetaEvent {
    DetailEvent(std::string const &label, std::string const &message)
        : MetaEvent{}
        , label{ label }
        , message{ message } { }
    std::string label;
    std::string message;
};

struct WarningEvent : public MetaEvent {
    WarningEvent(std::string const &label, std::string const &message)
        : MetaEvent{}
        , label{ label }
        , message{ message } { }
    std::string label;
    std::string message;
};

struct SuccessEvent : public MetaEvent {
    SuccessEvent(std::string const &subject)
        : MetaEvent{}
        , subject{ subject } { }
    std::string subject;
};

struct FailureEvent : public MetaEvent {
    struct Data {
        enum class Type {
            DEFINITION,
            GRAPH,
            STEP,
            TASK,
            UPLOAD
        };
        Data(
            Type type,
            std::string const &path,
            std::string const &message,
            std::string const &detail = "")
            : type{ type }
            , path{ path }
            , message{ message }
            , detail{ detail } { }
        Type type;
        std::string path;
        std::string message;
        std::string detail;
    };

    FailureEvent(
        std::string const &subject,
        std::vector<Data> const &issues)
        : MetaEvent{}
        , subject{ subject }
        , issues{ issues } { }
    std::string subject;
    std::vector<Data> issues;
};

// a task changed its lifecycle status
struct TaskEvent : public MetaEvent {
    TaskEvent(
        std::string const &task_id,
        std::string const &kind,
        std::string const &status,
        std::string const &subject)
        : MetaEvent{}
        , task_id{ task_id }
        , kind{ kind }
        , status{ status }
        , subject{ subject } { }
    std::string task_id;
    std::string kind;
    std::string status;
    std::string subject;
};
