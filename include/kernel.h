#ifndef SO_KERNEL_H
#define SO_KERNEL_H

/**
 * Radially symmetric smoothing kernel of a particle fluid solver.
 *
 * Not every kernel defines every derivative; calling an unsupported one
 * throws std::logic_error.
 */
struct Kernel {
    virtual ~Kernel() = default;

    virtual double w(double radius) const = 0;
    // Gradient factor, to be multiplied with the offset vector
    virtual double grad_w(double radius) const = 0;
    virtual double laplace_w(double radius) const = 0;
};

/**
 * Poly6 kernel, Section 3.5 in Mueller et al. (2003).
 */
struct Poly6 : Kernel {
    explicit Poly6(double smoothing_radius);

    double w(double radius) const override;
    double grad_w(double radius) const override;
    double laplace_w(double radius) const override;

private:
    double h;
    double w_const;
    double grad_w_const;
};

/**
 * Spiky kernel, Section 3.5 in Mueller et al. (2003).
 */
struct Spiky : Kernel {
    explicit Spiky(double smoothing_radius);

    double w(double radius) const override;
    double grad_w(double radius) const override;
    double laplace_w(double radius) const override;

private:
    double h;
    double w_const;
    double grad_w_const;
};

/**
 * Viscosity kernel, Section 3.5 in Mueller et al. (2003).
 */
struct Viscosity : Kernel {
    explicit Viscosity(double smoothing_radius);

    double w(double radius) const override;
    double grad_w(double radius) const override;
    double laplace_w(double radius) const override;

private:
    double h;
    double w_const;
    double laplace_w_const;
};

#endif // SO_KERNEL_H
