#ifndef SO_CLOCK_H
#define SO_CLOCK_H

#include <GLFW/glfw3.h>

/**
 * Frame clock based on glfw, with a rolling average of frame and update times.
 *
 * Requires an initialized glfw context
 */
struct Clock {
public:
    static constexpr int window = 100;

    Clock() : current_tick(glfwGetTime()), last_tick(current_tick) {}

    // Returns the time in seconds since last call to `tick`.
    double tick() {
        this->last_tick = this->current_tick;
        this->current_tick = glfwGetTime();

        double dt = this->current_tick - this->last_tick;
        frame_times[sample % window] = dt;
        return dt;
    }

    // Records how long the simulation update of the current frame took.
    void record_update(double seconds) {
        update_times[sample % window] = seconds;
        sample++;
    }

    double average_frame_time() const { return average(frame_times); }
    double average_update_time() const { return average(update_times); }

private:
    static double average(const double (&times)[window]) {
        double sum = 0.0;
        for (double t : times) sum += t;
        return sum / window;
    }

    double current_tick;
    double last_tick;

    long sample = 0;
    double frame_times[window] = {};
    double update_times[window] = {};
};

#endif // SO_CLOCK_H
