// IModule.h

/**
 * @brief
 * This interface defines the core functionalities that any module should implement.
 * Each concrete module (CpuLoadModule, MemoryLoadModule) wraps one engine and
 * encapsulates its own config + validation.
 */

#ifndef BASELOAD_IMODULE_H
#define BASELOAD_IMODULE_H

namespace baseload {

class IModule {
public:
    virtual bool validate() = 0;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual ~IModule() = default;
};

} // namespace baseload
#endif // BASELOAD_IMODULE_H
