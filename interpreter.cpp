#include "interpreter.h"

const char *stepResultName(StepResult result)
{
    switch(result) {
        case CONTINUE: return "continue";
        case UNSUPPORTED_INSTRUCTION: return "unsupported instruction";
        case STACK_UNDERFLOW: return "return with empty stack";
        case ADDRESS_OUT_OF_RANGE: return "address outside memory";
    }
    return "unknown";
}
